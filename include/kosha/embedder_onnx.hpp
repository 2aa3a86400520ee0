#pragma once
// OnnxEmbedder: sentence-transformer embeddings via ONNX Runtime
//
// - WordPiece tokenization against the model's vocab.txt
// - Mean pooling weighted by the attention mask (or CLS / max)
// - L2 normalization, so squared distance tracks cosine
// - Model introspection for input/output names and hidden size

#include "embedder.hpp"
#include <onnxruntime/core/session/onnxruntime_cxx_api.h>
#include <array>
#include <fstream>
#include <limits>

namespace kosha {

enum class PoolingStrategy {
    Mean,   // Mean of token embeddings (weighted by attention)
    CLS,    // [CLS] token embedding
    Max     // Max across the sequence
};

// Model shape detected from ONNX
struct ModelInfo {
    std::vector<std::string> input_names;
    std::vector<std::string> output_names;
    int64_t hidden_dim = 384;
    bool has_token_type_ids = false;
    bool outputs_pooled = false;  // Some models output [batch, hidden] directly
};

class WordPieceTokenizer {
public:
    bool load(const std::string& vocab_path) {
        std::ifstream file(vocab_path);
        if (!file) return false;

        vocab_.clear();

        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
                line.pop_back();
            }
            if (!line.empty()) {
                vocab_[line] = id;
            }
            id++;
        }

        cls_id_ = get_id("[CLS]");
        sep_id_ = get_id("[SEP]");
        pad_id_ = std::max<int64_t>(get_id("[PAD]"), 0);
        unk_id_ = get_id("[UNK]");

        return unk_id_ >= 0;  // Must have UNK token
    }

    struct Encoding {
        std::vector<int64_t> input_ids;
        std::vector<int64_t> attention_mask;
        std::vector<int64_t> token_type_ids;
    };

    Encoding encode(const std::string& text, size_t max_length) const {
        std::vector<int64_t> tokens;
        if (cls_id_ >= 0) tokens.push_back(cls_id_);

        for (const auto& word : split_into_words(text)) {
            for (int64_t tok : tokenize_word(word)) {
                if (tokens.size() >= max_length - 1) break;
                tokens.push_back(tok);
            }
            if (tokens.size() >= max_length - 1) break;
        }

        if (sep_id_ >= 0) tokens.push_back(sep_id_);

        Encoding out;
        out.input_ids = tokens;
        out.attention_mask.assign(tokens.size(), 1);
        out.token_type_ids.assign(tokens.size(), 0);

        while (out.input_ids.size() < max_length) {
            out.input_ids.push_back(pad_id_);
            out.attention_mask.push_back(0);
            out.token_type_ids.push_back(0);
        }
        return out;
    }

    int64_t get_id(const std::string& token) const {
        auto it = vocab_.find(token);
        return it != vocab_.end() ? it->second : -1;
    }

    size_t vocab_size() const { return vocab_.size(); }

private:
    std::vector<std::string> split_into_words(const std::string& text) const {
        std::vector<std::string> words;
        std::string current;

        for (size_t i = 0; i < text.size(); ) {
            unsigned char c = text[i];

            if (c < 0x80) {
                if (std::isspace(c)) {
                    if (!current.empty()) {
                        words.push_back(current);
                        current.clear();
                    }
                } else if (std::ispunct(c)) {
                    if (!current.empty()) {
                        words.push_back(current);
                        current.clear();
                    }
                    words.push_back(std::string(1, static_cast<char>(c)));
                } else {
                    current += static_cast<char>(std::tolower(c));
                }
                i++;
            } else {
                size_t char_len = 1;
                if ((c & 0xE0) == 0xC0) char_len = 2;
                else if ((c & 0xF0) == 0xE0) char_len = 3;
                else if ((c & 0xF8) == 0xF0) char_len = 4;

                if (!current.empty()) {
                    words.push_back(current);
                    current.clear();
                }
                words.push_back(text.substr(i, char_len));
                i += char_len;
            }
        }

        if (!current.empty()) words.push_back(current);
        return words;
    }

    std::vector<int64_t> tokenize_word(const std::string& word) const {
        std::vector<int64_t> tokens;
        if (word.empty()) return tokens;

        auto whole = vocab_.find(word);
        if (whole != vocab_.end()) {
            tokens.push_back(whole->second);
            return tokens;
        }

        // Greedy longest-match WordPiece
        size_t start = 0;
        while (start < word.length()) {
            size_t end = word.length();
            int64_t cur_id = -1;

            while (start < end) {
                std::string piece = word.substr(start, end - start);
                if (start > 0) piece = "##" + piece;

                auto it = vocab_.find(piece);
                if (it != vocab_.end()) {
                    cur_id = it->second;
                    break;
                }
                end--;
            }

            if (cur_id < 0) {
                tokens.push_back(unk_id_);
                start++;
            } else {
                tokens.push_back(cur_id);
                start = end;
            }
        }
        return tokens;
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_id_ = -1;
    int64_t sep_id_ = -1;
    int64_t pad_id_ = 0;
    int64_t unk_id_ = -1;
};

class OnnxEmbedder : public Embedder {
public:
    struct Config {
        PoolingStrategy pooling = PoolingStrategy::Mean;
        size_t max_seq_length = 128;
        int num_threads = 0;  // 0 = runtime default
    };

    OnnxEmbedder() : env_(ORT_LOGGING_LEVEL_WARNING, "kosha") {}

    explicit OnnxEmbedder(Config config)
        : env_(ORT_LOGGING_LEVEL_WARNING, "kosha"), config_(config) {}

    // Load model and vocabulary. False on failure, see error().
    bool load(const std::string& model_path, const std::string& vocab_path) {
        try {
            if (!tokenizer_.load(vocab_path)) {
                error_ = "Failed to load vocabulary from: " + vocab_path;
                return false;
            }

            Ort::SessionOptions opts;
            if (config_.num_threads > 0) {
                opts.SetIntraOpNumThreads(config_.num_threads);
            }
            opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), opts);
            introspect_model();
            model_path_ = model_path;
            ready_ = true;
            return true;

        } catch (const Ort::Exception& e) {
            error_ = std::string("ONNX error: ") + e.what();
            return false;
        }
    }

    Vector embed(const std::string& text) override {
        auto results = embed_batch({text});
        return std::move(results.front());
    }

    std::vector<Vector> embed_batch(const std::vector<std::string>& texts) override {
        if (!ready_) throw EmbeddingError("ONNX embedder is not loaded");
        if (texts.empty()) return {};

        std::vector<std::string> normalized;
        normalized.reserve(texts.size());
        for (const auto& t : texts) {
            normalized.push_back(preprocessor_.normalize(t));
            if (normalized.back().empty()) {
                throw EmbeddingError("text is empty after normalization");
            }
        }

        try {
            return run_inference(normalized);
        } catch (const Ort::Exception& e) {
            throw EmbeddingError(std::string("Inference error: ") + e.what());
        }
    }

    size_t dimension() const override { return static_cast<size_t>(model_info_.hidden_dim); }

    std::string name() const override { return "onnx:" + model_path_; }

    bool ready() const { return ready_; }
    const std::string& error() const { return error_; }
    const ModelInfo& model_info() const { return model_info_; }

private:
    void introspect_model() {
        Ort::AllocatorWithDefaultOptions allocator;

        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            auto name_ptr = session_->GetInputNameAllocated(i, allocator);
            std::string name = name_ptr.get();
            if (name == "token_type_ids") model_info_.has_token_type_ids = true;
            model_info_.input_names.push_back(name);
        }

        for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
            auto name_ptr = session_->GetOutputNameAllocated(i, allocator);
            model_info_.output_names.push_back(name_ptr.get());

            if (i == 0) {
                auto shape = session_->GetOutputTypeInfo(i).GetTensorTypeAndShapeInfo().GetShape();
                if (shape.size() == 2 && shape[1] > 0) {
                    model_info_.outputs_pooled = true;
                    model_info_.hidden_dim = shape[1];
                } else if (shape.size() == 3 && shape[2] > 0) {
                    model_info_.hidden_dim = shape[2];
                }
            }
        }

        // ONNX needs stable C-strings
        input_names_cstr_.clear();
        for (const auto& name : model_info_.input_names) input_names_cstr_.push_back(name.c_str());
        output_names_cstr_.clear();
        for (const auto& name : model_info_.output_names) output_names_cstr_.push_back(name.c_str());
    }

    std::vector<Vector> run_inference(const std::vector<std::string>& texts) {
        size_t batch_size = texts.size();
        size_t seq_len = config_.max_seq_length;

        std::vector<WordPieceTokenizer::Encoding> encodings;
        encodings.reserve(batch_size);
        for (const auto& text : texts) {
            encodings.push_back(tokenizer_.encode(text, seq_len));
        }

        std::vector<int64_t> ids, mask, type_ids;
        ids.reserve(batch_size * seq_len);
        mask.reserve(batch_size * seq_len);
        type_ids.reserve(batch_size * seq_len);
        for (const auto& enc : encodings) {
            ids.insert(ids.end(), enc.input_ids.begin(), enc.input_ids.end());
            mask.insert(mask.end(), enc.attention_mask.begin(), enc.attention_mask.end());
            type_ids.insert(type_ids.end(), enc.token_type_ids.begin(), enc.token_type_ids.end());
        }

        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::array<int64_t, 2> shape = {
            static_cast<int64_t>(batch_size),
            static_cast<int64_t>(seq_len)
        };

        // Inputs in the order the model declares them
        std::vector<Ort::Value> inputs;
        for (const auto& name : model_info_.input_names) {
            std::vector<int64_t>* source = nullptr;
            if (name == "input_ids") source = &ids;
            else if (name == "attention_mask") source = &mask;
            else if (name == "token_type_ids") source = &type_ids;
            if (!source) {
                throw EmbeddingError("Unsupported model input: " + name);
            }
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memory_info, source->data(), source->size(), shape.data(), shape.size()));
        }

        auto outputs = session_->Run(
            Ort::RunOptions{nullptr},
            input_names_cstr_.data(), inputs.data(), inputs.size(),
            output_names_cstr_.data(), output_names_cstr_.size());

        auto& output = outputs[0];
        auto out_shape = output.GetTensorTypeAndShapeInfo().GetShape();
        const float* data = output.GetTensorData<float>();

        std::vector<Vector> results;
        results.reserve(batch_size);
        for (size_t b = 0; b < batch_size; ++b) {
            Vector v;
            if (out_shape.size() == 2) {
                int64_t hidden = out_shape[1];
                v = Vector(std::vector<float>(data + b * hidden, data + (b + 1) * hidden));
            } else {
                int64_t tokens = out_shape[1];
                int64_t hidden = out_shape[2];
                v = pool(data + b * tokens * hidden, tokens, hidden, encodings[b].attention_mask);
            }
            if (v.is_zero()) throw EmbeddingError("model produced a zero embedding");
            v.normalize();
            results.push_back(std::move(v));
        }
        return results;
    }

    Vector pool(const float* tokens, int64_t seq_len, int64_t hidden,
                const std::vector<int64_t>& attention_mask) const {
        Vector pooled(static_cast<size_t>(hidden));

        switch (config_.pooling) {
            case PoolingStrategy::CLS:
                for (int64_t d = 0; d < hidden; ++d) pooled[d] = tokens[d];
                break;

            case PoolingStrategy::Mean: {
                float sum_mask = 0.0f;
                for (int64_t t = 0; t < seq_len; ++t) {
                    if (attention_mask[t] != 1) continue;
                    sum_mask += 1.0f;
                    for (int64_t d = 0; d < hidden; ++d) pooled[d] += tokens[t * hidden + d];
                }
                if (sum_mask > 0) {
                    for (int64_t d = 0; d < hidden; ++d) pooled[d] /= sum_mask;
                }
                break;
            }

            case PoolingStrategy::Max:
                for (int64_t d = 0; d < hidden; ++d) {
                    pooled[d] = -std::numeric_limits<float>::infinity();
                }
                for (int64_t t = 0; t < seq_len; ++t) {
                    if (attention_mask[t] != 1) continue;
                    for (int64_t d = 0; d < hidden; ++d) {
                        pooled[d] = std::max(pooled[d], tokens[t * hidden + d]);
                    }
                }
                break;
        }
        return pooled;
    }

    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    WordPieceTokenizer tokenizer_;
    TextPreprocessor preprocessor_;
    Config config_;
    ModelInfo model_info_;
    std::vector<const char*> input_names_cstr_;
    std::vector<const char*> output_names_cstr_;
    std::string model_path_;
    bool ready_ = false;
    std::string error_;
};

// Factory: mean pooling, cached. Throws EmbeddingError when the model
// cannot be loaded.
inline std::shared_ptr<Embedder> create_onnx_embedder(
    const std::string& model_path,
    const std::string& vocab_path,
    size_t cache_size = 10000)
{
    OnnxEmbedder::Config config;
    config.pooling = PoolingStrategy::Mean;

    auto inner = std::make_shared<OnnxEmbedder>(config);
    if (!inner->load(model_path, vocab_path)) {
        throw EmbeddingError(inner->error());
    }
    return std::make_shared<CachingEmbedder>(inner, cache_size);
}

} // namespace kosha

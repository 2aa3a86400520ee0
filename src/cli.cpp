// kosha: Command-line interface for the knowledge base and tools
//
// Usage: kosha <command> [options]
//
// Commands:
//   stats                 Show knowledge base statistics
//   ingest <file.json>    Add passages ([{title, content}, ...])
//   search <query>        Semantic search
//   tools                 List registered tools
//   call <tool> <json>    Run one tool call through the dispatcher
//   help                  Show this help

#include <kosha/kosha.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdio>

using namespace kosha;

namespace {

const char* prog_name(const char* prog) {
    const char* slash = std::strrchr(prog, '/');
    return slash ? slash + 1 : prog;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "kosha " << KOSHA_VERSION << " - Support knowledge base and tools\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  stats                 Show knowledge base statistics\n"
              << "  ingest <file.json>    Add passages from a JSON array of {title, content}\n"
              << "  search <query>        Semantic search (search_knowledge_base, counts against --conversation)\n"
              << "  tools                 List registered tools\n"
              << "  call <tool> <json>    Run one tool call (arguments as a JSON object)\n"
              << "  help                  Show this help\n\n"
              << "Options:\n"
              << "  --path PATH           Knowledge base directory (default: $KOSHA_DATA_DIR or ./knowledge_base)\n"
              << "  --k N                 Results for search (default: 3)\n"
              << "  --conversation ID     Conversation for call and search (default: cli)\n"
              << "  --no-seed             Do not seed an empty knowledge base with samples\n"
              << "  --json                Output as JSON\n"
              << "  -v, --version         Show version\n"
#ifdef KOSHA_WITH_ONNX
              << "  --model PATH          ONNX model path\n"
              << "  --vocab PATH          Vocabulary file path\n"
#endif
              ;
}

void attach_embedder(Backend& backend, const BackendConfig& config) {
#ifdef KOSHA_WITH_ONNX
    if (config.model_path.empty() || config.vocab_path.empty()) return;
    backend.attach_embedder(create_onnx_embedder(config.model_path, config.vocab_path));
    std::cerr << "[kosha] Embedder: " << config.model_path << "\n";
#else
    (void)backend;
    if (!config.model_path.empty()) {
        std::cerr << "[kosha] Built without ONNX Runtime; ignoring model " << config.model_path << "\n";
    }
#endif
}

int cmd_stats(Backend& backend, bool json_output) {
    auto s = backend.stats();
    if (json_output) {
        json out = {
            {"passages", s.passages},
            {"index_size", s.index_size},
            {"dimension", s.dimension},
            {"embedder", s.embedder},
            {"path", backend.config().data_dir},
            {"tools", backend.dispatcher().tools().size()}
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "Knowledge Base\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Path:       " << backend.config().data_dir << "\n";
    std::cout << "Passages:   " << s.passages << "\n";
    std::cout << "Index rows: " << s.index_size << "\n";
    std::cout << "Dimension:  " << s.dimension << "\n";
    std::cout << "Embedder:   " << s.embedder << "\n";
    std::cout << "Tools:      " << backend.dispatcher().tools().size() << "\n";
    return 0;
}

int cmd_ingest(Backend& backend, const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        std::cerr << "Error: cannot open " << file << "\n";
        return 1;
    }

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        std::cerr << "Error: " << file << " is not valid JSON\n";
        return 1;
    }
    const json& list = doc.is_object() && doc.contains("passages") ? doc["passages"] : doc;
    if (!list.is_array()) {
        std::cerr << "Error: expected an array of {title, content}\n";
        return 1;
    }

    std::vector<PassageInput> inputs;
    for (size_t i = 0; i < list.size(); ++i) {
        const auto& p = list[i];
        if (!p.is_object() || !p.value("title", json()).is_string() ||
            !p.value("content", json()).is_string()) {
            std::cerr << "Error: entry " << i << " needs string title and content\n";
            return 1;
        }
        inputs.push_back({p["title"].get<std::string>(), p["content"].get<std::string>()});
    }

    auto ids = backend.ingest(inputs);
    std::cout << "Ingested " << ids.size() << " passages (total " << backend.stats().passages << ")\n";
    return 0;
}

// Goes through the dispatcher like any other tool call
int cmd_search(Backend& backend, const std::string& conversation,
               const std::string& query, size_t k, bool json_output) {
    ToolResult r = backend.call(conversation, "search_knowledge_base",
                                {{"query", query}, {"k", k}});
    if (!r.ok()) {
        std::cerr << "[" << r.kind() << "] " << r.content << "\n";
        return 1;
    }

    const json& results = r.structured["results"];
    if (json_output) {
        std::cout << results.dump(2) << "\n";
        return 0;
    }

    if (results.empty()) {
        std::cout << "No results found for: " << query << "\n";
        return 0;
    }

    std::cout << "Results for: " << query << "\n";
    std::cout << "═══════════════════════════════\n";
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& h = results[i];
        char score[16];
        snprintf(score, sizeof(score), "%.3f", h["similarity"].get<double>());
        std::cout << "\n[" << (i + 1) << "] " << h["title"].get<std::string>()
                  << " (score: " << score << ")\n";
        std::cout << h["content"].get<std::string>() << "\n";
    }
    return 0;
}

int cmd_tools(Backend& backend, bool json_output) {
    auto tools = backend.dispatcher().tools();
    if (json_output) {
        json out = json::array();
        for (const auto& t : tools) {
            out.push_back({{"name", t.name}, {"description", t.description},
                           {"inputSchema", t.input_schema()}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    for (const auto& t : tools) {
        std::cout << t.name << "(";
        for (size_t i = 0; i < t.params.size(); ++i) {
            const auto& p = t.params[i];
            if (i > 0) std::cout << ", ";
            std::cout << p.name << (p.required ? "" : "?") << ": " << param_type_name(p.type);
        }
        std::cout << ")\n    " << t.description << "\n";
    }
    return 0;
}

int cmd_call(Backend& backend, const std::string& conversation,
             const std::string& tool, const std::string& args_text, bool json_output) {
    json arguments = args_text.empty() ? json::object() : json::parse(args_text, nullptr, false);
    if (arguments.is_discarded()) {
        std::cerr << "Error: arguments are not valid JSON\n";
        return 1;
    }

    ToolResult r = backend.call(conversation, tool, arguments);
    if (json_output) {
        json out = {
            {"status", r.kind()},
            {"tool", r.tool},
            {"content", r.content},
            {"terminal", r.terminal()}
        };
        if (!r.structured.is_null()) out["structured"] = r.structured;
        if (!r.parameter.empty()) out["parameter"] = r.parameter;
        std::cout << out.dump(2) << "\n";
    } else if (r.ok()) {
        std::cout << r.content << "\n";
    } else {
        std::cerr << "[" << r.kind() << "] " << r.content << "\n";
    }
    return r.ok() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::vector<std::string> positional;
    std::string conversation = "cli";
    size_t k = 0;
    bool json_output = false;

    try {
        BackendConfig config = BackendConfig::from_env();

        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
                config.data_dir = argv[++i];
            } else if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
                config.model_path = argv[++i];
            } else if (strcmp(argv[i], "--vocab") == 0 && i + 1 < argc) {
                config.vocab_path = argv[++i];
            } else if (strcmp(argv[i], "--k") == 0 && i + 1 < argc) {
                k = config_detail::parse_count("--k", argv[++i]);
            } else if (strcmp(argv[i], "--conversation") == 0 && i + 1 < argc) {
                conversation = argv[++i];
            } else if (strcmp(argv[i], "--no-seed") == 0) {
                config.seed_samples = false;
            } else if (strcmp(argv[i], "--json") == 0) {
                json_output = true;
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "kosha " << KOSHA_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-' || argv[i][1] == '\0') {
                if (command.empty()) command = argv[i];
                else positional.push_back(argv[i]);
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (command.empty() || command == "help") {
            print_usage(argv[0]);
            return 0;
        }

        if (command != "stats" && command != "ingest" && command != "search" &&
            command != "tools" && command != "call") {
            std::cerr << "Unknown command: " << command << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
        if (command == "ingest" && positional.empty()) {
            std::cerr << "Usage: kosha ingest <file.json>\n";
            return 1;
        }
        if (command == "search" && positional.empty()) {
            std::cerr << "Usage: kosha search <query> [--k N]\n";
            return 1;
        }
        if (command == "call" && positional.empty()) {
            std::cerr << "Usage: kosha call <tool> '<json arguments>' [--conversation ID]\n";
            return 1;
        }

        Backend backend(config);
        attach_embedder(backend, config);
        backend.open();

        int result = 0;
        if (command == "stats") {
            result = cmd_stats(backend, json_output);
        } else if (command == "ingest") {
            result = cmd_ingest(backend, positional[0]);
        } else if (command == "search") {
            std::string query;
            for (size_t i = 0; i < positional.size(); ++i) {
                if (i > 0) query += ' ';
                query += positional[i];
            }
            result = cmd_search(backend, conversation, query, k ? k : config.default_k, json_output);
        } else if (command == "tools") {
            result = cmd_tools(backend, json_output);
        } else if (command == "call") {
            result = cmd_call(backend, conversation, positional[0],
                              positional.size() > 1 ? positional[1] : "", json_output);
        }

        backend.close();
        return result;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

#pragma once
// Core types: passages, vectors, search hits
//
// A passage is a unit of knowledge. Its meaning is a unit vector.
// Once ingested, neither changes.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace kosha {

// Embedding dimension (all-MiniLM-L6-v2 compatible)
constexpr size_t EMBED_DIM = 384;

// Passage identifiers are assigned sequentially at ingest
using PassageId = uint64_t;

// Semantic vector - the meaning of a passage
class Vector {
public:
    std::vector<float> data;

    Vector() = default;

    explicit Vector(size_t dim) : data(dim, 0.0f) {}

    explicit Vector(std::vector<float> v) : data(std::move(v)) {}

    static Vector zeros(size_t dim = EMBED_DIM) {
        return Vector(dim);
    }

    const float* as_ptr() const { return data.data(); }
    float* as_ptr() { return data.data(); }
    size_t size() const { return data.size(); }

    float& operator[](size_t i) { return data[i]; }
    const float& operator[](size_t i) const { return data[i]; }

    float dot(const Vector& other) const {
        float sum = 0.0f;
        size_t n = std::min(data.size(), other.data.size());
        for (size_t i = 0; i < n; ++i) {
            sum += data[i] * other.data[i];
        }
        return sum;
    }

    // Cosine similarity (optimized: single pass)
    float cosine(const Vector& other) const {
        float dot = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
        size_t n = std::min(data.size(), other.data.size());
        for (size_t i = 0; i < n; ++i) {
            float ai = data[i];
            float bi = other.data[i];
            dot += ai * bi;
            norm_a += ai * ai;
            norm_b += bi * bi;
        }
        float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
        return denom > 0.0f ? dot / denom : 0.0f;
    }

    // Normalize to unit vector
    void normalize() {
        float norm = 0.0f;
        for (float x : data) norm += x * x;
        norm = std::sqrt(norm);
        if (norm > 0.0f) {
            for (float& x : data) x /= norm;
        }
    }

    // Check if vector is effectively zero (no embedding)
    bool is_zero() const {
        return norm_sq() < 1e-10f;
    }

    // Squared L2 norm
    float norm_sq() const {
        float sum = 0.0f;
        for (float x : data) sum += x * x;
        return sum;
    }
};

// Squared Euclidean distance. For unit vectors d = 2 - 2cos.
inline float l2_sq(const float* a, const float* b, size_t dim) {
    float sum = 0.0f;
    for (size_t i = 0; i < dim; ++i) {
        float diff = a[i] - b[i];
        sum += diff * diff;
    }
    return sum;
}

// Map a squared distance between unit vectors back to cosine similarity
inline float distance_to_similarity(float distance) {
    return std::clamp(1.0f - distance * 0.5f, -1.0f, 1.0f);
}

// What the caller hands to ingest
struct PassageInput {
    std::string title;
    std::string content;
};

// An ingested passage. Its embedding lives in the index row with the
// same position as the passage in the store.
struct Passage {
    PassageId id = 0;
    std::string title;
    std::string content;

    // The text that gets embedded
    std::string text() const {
        return title + "\n" + content;
    }
};

// One ranked search result
struct SearchHit {
    Passage passage;
    float similarity = 0.0f;  // Higher is closer
    float distance = 0.0f;    // Squared L2 between unit vectors
};

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    if (ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0) {
        ok = true;
    } else {
        ok = false;
    }

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

// Read a whole file; false if it cannot be opened
inline bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    FILE* f = ::fopen(path.c_str(), "rb");
    if (!f) return false;
    out.clear();
    uint8_t buf[65536];
    size_t n;
    while ((n = ::fread(buf, 1, sizeof(buf), f)) > 0) {
        out.insert(out.end(), buf, buf + n);
    }
    bool ok = ::ferror(f) == 0;
    ::fclose(f);
    return ok;
}

inline bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace kosha

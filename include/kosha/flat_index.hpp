#pragma once
// Flat index: exact nearest-neighbor search over unit vectors
//
// Rows are stored contiguously in insertion order. Search is a full scan
// with squared Euclidean distance; ties go to the earlier row.

#include "types.hpp"
#include "version.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace kosha {

constexpr uint32_t INDEX_MAGIC = 0x5844494B;  // "KIDX"

// Distance pair for ranking
struct DistPair {
    float distance;
    size_t row;

    DistPair() : distance(0.0f), row(0) {}
    DistPair(float d, size_t r) : distance(d), row(r) {}

    // Row breaks ties so ranking is stable
    bool operator<(const DistPair& o) const {
        return distance < o.distance || (distance == o.distance && row < o.row);
    }
};

class FlatIndex {
public:
    explicit FlatIndex(size_t dimension = EMBED_DIM) : dim_(dimension) {
        if (dim_ == 0) throw std::invalid_argument("FlatIndex: dimension must be positive");
    }

    // Append a row; returns its position
    size_t add(const Vector& v) {
        if (v.size() != dim_) {
            throw std::invalid_argument("FlatIndex: vector has dimension " +
                std::to_string(v.size()) + ", index expects " + std::to_string(dim_));
        }
        rows_.insert(rows_.end(), v.data.begin(), v.data.end());
        return size() - 1;
    }

    // k nearest rows, nearest first
    std::vector<DistPair> search(const Vector& query, size_t k) const {
        if (query.size() != dim_) {
            throw std::invalid_argument("FlatIndex: query has dimension " +
                std::to_string(query.size()) + ", index expects " + std::to_string(dim_));
        }
        size_t n = size();
        if (n == 0 || k == 0) return {};

        std::vector<DistPair> all;
        all.reserve(n);
        for (size_t r = 0; r < n; ++r) {
            all.emplace_back(l2_sq(query.as_ptr(), rows_.data() + r * dim_, dim_), r);
        }

        size_t top = std::min(k, n);
        std::partial_sort(all.begin(), all.begin() + top, all.end());
        all.resize(top);
        return all;
    }

    // Row copy (for tests and inspection)
    Vector row(size_t r) const {
        if (r >= size()) throw std::out_of_range("FlatIndex: row out of range");
        return Vector(std::vector<float>(rows_.begin() + r * dim_, rows_.begin() + (r + 1) * dim_));
    }

    size_t size() const { return rows_.size() / dim_; }
    bool empty() const { return rows_.empty(); }
    size_t dimension() const { return dim_; }

    void reserve(size_t n) { rows_.reserve(n * dim_); }

    // Serialize to bytes for persistence
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> data;
        data.reserve(24 + rows_.size() * sizeof(float));

        auto write = [&data](const void* ptr, size_t size) {
            const uint8_t* bytes = static_cast<const uint8_t*>(ptr);
            data.insert(data.end(), bytes, bytes + size);
        };

        // Header: magic, version, dimension, row count
        uint32_t magic = INDEX_MAGIC;
        uint32_t version = KOSHA_INDEX_FORMAT_VERSION;
        uint64_t dim = dim_;
        uint64_t count = size();
        write(&magic, sizeof(magic));
        write(&version, sizeof(version));
        write(&dim, sizeof(dim));
        write(&count, sizeof(count));

        write(rows_.data(), rows_.size() * sizeof(float));
        return data;
    }

    // Deserialize from bytes
    static FlatIndex deserialize(const std::vector<uint8_t>& data) {
        size_t pos = 0;

        auto read = [&data, &pos](void* ptr, size_t size) {
            if (pos + size > data.size()) {
                char error_buf[256];
                snprintf(error_buf, sizeof(error_buf),
                    "Index deserialize: unexpected end at offset %zu, need %zu bytes, have %zu bytes",
                    pos, size, data.size() - pos);
                throw std::runtime_error(error_buf);
            }
            std::memcpy(ptr, data.data() + pos, size);
            pos += size;
        };

        uint32_t magic, version;
        read(&magic, sizeof(magic));
        read(&version, sizeof(version));

        if (magic != INDEX_MAGIC) throw std::runtime_error("Index deserialize: invalid magic");
        if (!version::index_format_supported(version)) {
            throw std::runtime_error("Index deserialize: unsupported version " + std::to_string(version));
        }

        uint64_t dim, count;
        read(&dim, sizeof(dim));
        read(&count, sizeof(count));
        if (dim == 0) throw std::runtime_error("Index deserialize: zero dimension");

        // Payload must be exactly count rows; checked before allocating
        size_t remaining = data.size() - pos;
        if (count > remaining / sizeof(float) / dim ||
            remaining != static_cast<size_t>(dim * count) * sizeof(float)) {
            throw std::runtime_error("Index deserialize: header claims " + std::to_string(count) +
                " rows of dimension " + std::to_string(dim) + " but payload is " +
                std::to_string(remaining) + " bytes");
        }

        FlatIndex index(static_cast<size_t>(dim));
        index.rows_.resize(static_cast<size_t>(dim * count));
        read(index.rows_.data(), index.rows_.size() * sizeof(float));
        return index;
    }

private:
    size_t dim_;
    std::vector<float> rows_;
};

} // namespace kosha

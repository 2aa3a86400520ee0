#pragma once

#define KOSHA_VERSION "1.4.0"
#define KOSHA_PROTOCOL_VERSION "2024-11-05"
#define KOSHA_INDEX_FORMAT_VERSION 1

namespace kosha {
namespace version {

inline bool index_format_supported(unsigned format) {
    // Index files carry their own format number; only exact matches load
    return format == KOSHA_INDEX_FORMAT_VERSION;
}

} // namespace version
} // namespace kosha

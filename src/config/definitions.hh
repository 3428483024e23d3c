#pragma once

#include <cstdint> // uint64_t
#include <vector>

namespace dsio {
using Shape = std::vector<uint64_t>;

constexpr uint64_t DEFAULT_CHUNK_TARGET_BYTES = 10'000'000;   // 10 MB
constexpr uint64_t DEFAULT_BUFFER_TARGET_BYTES = 500'000'000; // 0.5 GB

constexpr const char* GENERIC_LOSSLESS_COMPRESSION = "generic-lossless";
constexpr const char* NO_COMPRESSION = "none";
} // namespace dsio

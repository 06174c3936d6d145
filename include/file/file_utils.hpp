#ifndef ZGS_FILE_UTILS_HPP
#define ZGS_FILE_UTILS_HPP

#include <cstdint>
#include <utility>

#include "crypto/hash.hpp"

namespace zgs {
namespace file {

// ---- PROTOCOL CONSTANTS ----
constexpr uint64_t DEFAULT_CHUNK_SIZE = 256;
constexpr uint64_t DEFAULT_SEGMENT_MAX_CHUNKS = 1024;
constexpr uint64_t DEFAULT_SEGMENT_SIZE = DEFAULT_CHUNK_SIZE * DEFAULT_SEGMENT_MAX_CHUNKS;

// Hash of one chunk of zero bytes
const crypto::Hash& empty_chunk_hash();
// All-zero hash, reported for an empty segment
const crypto::Hash& zero_hash();

// ceil(total / unit), zero for an empty input
uint64_t num_splits(uint64_t total, uint64_t unit);

// Smallest power of two >= value
uint64_t next_pow2(uint64_t value);

// Flow padded chunk count and the next power of two of the chunk count
std::pair<uint64_t, uint64_t> compute_padded_size(uint64_t chunks);

// Integer log2 of a power of two
uint64_t log2_pow2(uint64_t value);

} // namespace file
} // namespace zgs

#endif // ZGS_FILE_UTILS_HPP

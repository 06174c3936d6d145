#include "file/file_utils.hpp"

#include <vector>

namespace zgs {
namespace file {

const crypto::Hash& empty_chunk_hash() {
    static const crypto::Hash hash =
        crypto::keccak256(std::vector<uint8_t>(DEFAULT_CHUNK_SIZE, 0));
    return hash;
}

const crypto::Hash& zero_hash() {
    static const crypto::Hash hash{};
    return hash;
}

uint64_t num_splits(uint64_t total, uint64_t unit) {
    if (total == 0) {
        return 0;
    }
    return (total - 1) / unit + 1;
}

uint64_t next_pow2(uint64_t value) {
    value -= 1;
    value |= value >> 1;
    value |= value >> 2;
    value |= value >> 4;
    value |= value >> 8;
    value |= value >> 16;
    value |= value >> 32;
    return value + 1;
}

std::pair<uint64_t, uint64_t> compute_padded_size(uint64_t chunks) {
    uint64_t chunks_next_pow2 = next_pow2(chunks);
    if (chunks_next_pow2 == chunks) {
        return {chunks_next_pow2, chunks_next_pow2};
    }

    uint64_t min_chunk = chunks_next_pow2 >= 16 ? chunks_next_pow2 / 16 : 1;
    return {num_splits(chunks, min_chunk) * min_chunk, chunks_next_pow2};
}

uint64_t log2_pow2(uint64_t value) {
    uint64_t bits = 0;
    while (value > 1) {
        value >>= 1;
        ++bits;
    }
    return bits;
}

} // namespace file
} // namespace zgs

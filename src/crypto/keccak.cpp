#include "crypto/hash.hpp"
#include "crypto/byte_order.hpp"

#include <algorithm>
#include <cstring>

namespace zgs {
namespace crypto {

//===========================================================================
// Keccak-256 sponge over the Keccak-f[1600] permutation
//===========================================================================

Keccak256::Keccak256() {
    reset();
}

void Keccak256::reset() {
    std::memset(&state_, 0, sizeof(state_));
    block_.fill(0);
    block_len_ = 0;
}

void Keccak256::absorb_block(const uint8_t* block) {
    for (std::size_t i = 0; i < RATE / 8; ++i) {
        state_.a[i] ^= ByteOrder::loadLittleEndian64(block + 8 * i);
    }
    sha3_permute(&state_);
}

void Keccak256::update(const uint8_t* data, std::size_t len) {
    if (block_len_ > 0) {
        std::size_t take = std::min(len, RATE - block_len_);
        std::memcpy(block_.data() + block_len_, data, take);
        block_len_ += take;
        data += take;
        len -= take;
        if (block_len_ < RATE) {
            return;
        }
        absorb_block(block_.data());
        block_len_ = 0;
    }

    while (len >= RATE) {
        absorb_block(data);
        data += RATE;
        len -= RATE;
    }

    if (len > 0) {
        std::memcpy(block_.data(), data, len);
        block_len_ = len;
    }
}

void Keccak256::update(const std::vector<uint8_t>& data) {
    update(data.data(), data.size());
}

Hash Keccak256::finalize() {
    std::memset(block_.data() + block_len_, 0, RATE - block_len_);
    block_[block_len_] ^= 0x01;
    block_[RATE - 1] ^= 0x80;
    absorb_block(block_.data());

    Hash digest;
    for (std::size_t i = 0; i < DIGEST_SIZE / 8; ++i) {
        ByteOrder::storeLittleEndian64(state_.a[i], digest.data() + 8 * i);
    }

    reset();
    return digest;
}

//===========================================================================
// One shot helpers
//===========================================================================

Hash keccak256(const uint8_t* data, std::size_t len) {
    Keccak256 hasher;
    hasher.update(data, len);
    return hasher.finalize();
}

Hash keccak256(const std::vector<uint8_t>& data) {
    return keccak256(data.data(), data.size());
}

Hash keccak256(const std::string& data) {
    return keccak256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash hash_combine(const Hash& left, const Hash& right) {
    Keccak256 hasher;
    hasher.update(left.data(), left.size());
    hasher.update(right.data(), right.size());
    return hasher.finalize();
}

} // namespace crypto
} // namespace zgs

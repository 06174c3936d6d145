#ifndef ZGS_CRYPTO_HASH_HPP
#define ZGS_CRYPTO_HASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nettle/sha3.h>

namespace zgs {
namespace crypto {

// 32-byte Keccak-256 digest
using Hash = std::array<uint8_t, 32>;

// Streaming Keccak-256 (original Keccak padding, not FIPS-202 SHA3)
class Keccak256 {
public:
    // ---- CONSTANTS ----
    static constexpr std::size_t RATE = 136;
    static constexpr std::size_t DIGEST_SIZE = 32;

    Keccak256();

    // Absorbs more input, may be called any number of times
    void update(const uint8_t* data, std::size_t len);
    void update(const std::vector<uint8_t>& data);

    // Pads, squeezes and resets the hasher for reuse
    Hash finalize();

    void reset();

private:
    void absorb_block(const uint8_t* block);

    struct sha3_state state_;
    std::array<uint8_t, RATE> block_;
    std::size_t block_len_;
};

// ---- ONE SHOT HELPERS ----
Hash keccak256(const uint8_t* data, std::size_t len);
Hash keccak256(const std::vector<uint8_t>& data);
Hash keccak256(const std::string& data);

// H(left || right)
Hash hash_combine(const Hash& left, const Hash& right);

// ---- HEX ENCODING ----
// "0x" prefixed lowercase hex
std::string to_hex(const Hash& hash);
std::string bytes_to_hex(const uint8_t* data, std::size_t len);
std::string bytes_to_hex(const std::vector<uint8_t>& data);
// Accepts an optional "0x" prefix, throws EncodingError on malformed input
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
Hash hash_from_hex(const std::string& hex);

// ---- BASE64 ENCODING ----
std::string base64_encode(const uint8_t* data, std::size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace crypto
} // namespace zgs

#endif // ZGS_CRYPTO_HASH_HPP

#include "crypto/hash.hpp"
#include "crypto/crypto_error.hpp"

#include <openssl/evp.h>
#include <iomanip>
#include <sstream>

namespace zgs {
namespace crypto {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

//===========================================================================
// Hex
//===========================================================================

std::string bytes_to_hex(const uint8_t* data, std::size_t len) {
    std::stringstream ss;
    ss << "0x";
    for (std::size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string bytes_to_hex(const std::vector<uint8_t>& data) {
    return bytes_to_hex(data.data(), data.size());
}

std::string to_hex(const Hash& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

std::vector<uint8_t> hex_to_bytes(const std::string& hex) {
    std::size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if ((hex.size() - start) % 2 != 0) {
        throw EncodingError("odd length hex string");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve((hex.size() - start) / 2);
    for (std::size_t i = start; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw EncodingError("invalid hex character in '" + hex + "'");
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

Hash hash_from_hex(const std::string& hex) {
    std::vector<uint8_t> bytes = hex_to_bytes(hex);
    if (bytes.size() != Hash().size()) {
        throw EncodingError("expected 32 byte hash, got " + std::to_string(bytes.size()) + " bytes");
    }
    Hash hash;
    std::copy(bytes.begin(), bytes.end(), hash.begin());
    return hash;
}

//===========================================================================
// Base64 (OpenSSL EVP block codec)
//===========================================================================

std::string base64_encode(const uint8_t* data, std::size_t len) {
    if (len == 0) {
        return {};
    }
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(len));
    if (written < 0) {
        throw EncodingError("base64 encoding failed");
    }
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw EncodingError("base64 input length is not a multiple of 4");
    }

    std::vector<uint8_t> out(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        throw EncodingError("invalid base64 input");
    }

    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    std::size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

} // namespace crypto
} // namespace zgs

#ifndef ZGS_CRYPTO_ERROR_HPP
#define ZGS_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace zgs {
namespace crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed hex or base64 input
class EncodingError : public CryptoError {
public:
    explicit EncodingError(const std::string& message)
        : CryptoError("Encoding error: " + message) {}
};

} // namespace crypto
} // namespace zgs

#endif // ZGS_CRYPTO_ERROR_HPP

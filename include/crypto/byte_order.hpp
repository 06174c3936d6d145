#ifndef ZGS_BYTE_ORDER_HPP
#define ZGS_BYTE_ORDER_HPP

#include <cstdint>
#include <array>
#include <algorithm>
#include <cstring>

namespace zgs {
namespace crypto {

class ByteOrder {
public:
    // Detects if system is little endian
    static bool isLittleEndian() {
        static const uint16_t value = 0x0001;
        return *reinterpret_cast<const uint8_t*>(&value) == 0x01;
    }

    // Converts between host order and little endian (the Keccak lane order)
    template<typename T>
    static T toLittleEndian(T value) {
        if (!isLittleEndian()) {
            return byteSwap(value);
        }
        return value;
    }

    template<typename T>
    static T fromLittleEndian(T value) {
        return toLittleEndian(value);
    }

    // Reads 8 little endian bytes into a host order word
    static uint64_t loadLittleEndian64(const uint8_t* bytes) {
        uint64_t value;
        std::memcpy(&value, bytes, sizeof(value));
        return fromLittleEndian(value);
    }

    // Writes a host order word as 8 little endian bytes
    static void storeLittleEndian64(uint64_t value, uint8_t* bytes) {
        value = toLittleEndian(value);
        std::memcpy(bytes, &value, sizeof(value));
    }

private:
    // Generic byte swap implementation that works for any size T
    template<typename T>
    static T byteSwap(T value) {
        std::array<uint8_t, sizeof(T)> bytes;
        std::memcpy(bytes.data(), &value, sizeof(T));
        std::reverse(bytes.begin(), bytes.end());
        T result;
        std::memcpy(&result, bytes.data(), sizeof(T));
        return result;
    }
};

} // namespace crypto
} // namespace zgs

#endif // ZGS_BYTE_ORDER_HPP

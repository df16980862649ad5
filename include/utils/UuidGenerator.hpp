#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace nimbasms::utils {

/**
 * @brief Случайные идентификаторы: UUID v4 и граница multipart
 *
 * @note Thread-safe: генератор thread_local
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4 в каноническом виде (нижний регистр, с дефисами)
     */
    static std::string generate() {
        auto bytes = randomBytes();
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        std::string result;
        result.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                result += '-';
            }
            appendHex(result, bytes[i]);
        }
        return result;
    }

    /**
     * @brief Граница multipart тела: "----NimbaSmsBoundary" + 32 hex
     */
    static std::string multipartBoundary() {
        std::string result = "----NimbaSmsBoundary";
        for (uint8_t byte : randomBytes()) {
            appendHex(result, byte);
        }
        return result;
    }

private:
    static std::array<uint8_t, 16> randomBytes() {
        thread_local std::mt19937_64 engine{std::random_device{}()};

        std::array<uint8_t, 16> bytes{};
        for (size_t i = 0; i < bytes.size(); i += 8) {
            uint64_t chunk = engine();
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(chunk >> (j * 8));
            }
        }
        return bytes;
    }

    static void appendHex(std::string& out, uint8_t byte) {
        static const char digits[] = "0123456789abcdef";
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    }
};

} // namespace nimbasms::utils

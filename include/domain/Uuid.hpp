#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <utility>

namespace nimbasms::domain {

/**
 * @brief UUID в каноническом виде (нижний регистр, 8-4-4-4-12)
 *
 * Создаётся через parse(); по умолчанию nil UUID.
 */
class Uuid {
public:
    Uuid() : value_("00000000-0000-0000-0000-000000000000") {}

    /**
     * @brief Разобрать UUID
     *
     * Принимает канонический вид с дефисами и 32 hex-символа без дефисов,
     * регистр не важен.
     */
    static std::optional<Uuid> parse(const std::string& str) {
        std::string hex;
        if (str.size() == 36) {
            for (size_t i = 0; i < str.size(); ++i) {
                bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
                if (dash) {
                    if (str[i] != '-') return std::nullopt;
                    continue;
                }
                hex += str[i];
            }
        } else if (str.size() == 32) {
            hex = str;
        } else {
            return std::nullopt;
        }

        for (char& c : hex) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        return Uuid(hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4)
                    + "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12));
    }

    const std::string& toString() const { return value_; }

    bool isNil() const { return value_ == Uuid().value_; }

    bool operator==(const Uuid& other) const { return value_ == other.value_; }
    bool operator!=(const Uuid& other) const { return value_ != other.value_; }
    bool operator<(const Uuid& other) const { return value_ < other.value_; }

private:
    explicit Uuid(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

} // namespace nimbasms::domain

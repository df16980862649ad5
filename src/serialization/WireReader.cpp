#include "serialization/WireReader.hpp"
#include "domain/Validation.hpp"
#include "utils/Url.hpp"
#include <cmath>
#include <limits>

namespace nimbasms::serialization {

WireReader::WireReader(const nlohmann::json& json, std::string path)
    : json_(json)
    , path_(std::move(path))
{
    if (!json_.is_object()) {
        error_ = domain::Error::decode(path_.empty() ? "body" : path_, "expected a JSON object");
    }
}

std::string WireReader::qualify(const std::string& field) const {
    return path_.empty() ? field : path_ + "." + field;
}

void WireReader::fail(const std::string& field, const std::string& reason) {
    if (!error_) {
        error_ = domain::Error::decode(qualify(field), reason);
    }
}

const nlohmann::json* WireReader::find(const std::string& field) {
    if (failed()) return nullptr;
    auto it = json_.find(field);
    if (it == json_.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

const nlohmann::json* WireReader::findRequired(const std::string& field) {
    if (failed()) return nullptr;
    const auto* value = find(field);
    if (!value) {
        fail(field, "missing required field");
    }
    return value;
}

// ============================================
// СТРОКИ
// ============================================

std::optional<std::string> WireReader::requireString(const std::string& field, size_t maxLength) {
    if (!findRequired(field)) return std::nullopt;
    return optionalString(field, maxLength);
}

std::optional<std::string> WireReader::optionalString(const std::string& field, size_t maxLength) {
    const auto* value = find(field);
    if (!value) return std::nullopt;

    if (!value->is_string()) {
        fail(field, "expected a string");
        return std::nullopt;
    }

    auto str = value->get<std::string>();
    if (maxLength > 0 && domain::validation::characterCount(str) > maxLength) {
        fail(field, "longer than " + std::to_string(maxLength) + " characters");
        return std::nullopt;
    }
    return str;
}

// ============================================
// ЧИСЛА
// ============================================

std::optional<int64_t> WireReader::requireInt(const std::string& field,
                                              std::optional<int64_t> min,
                                              std::optional<int64_t> max) {
    if (!findRequired(field)) return std::nullopt;
    return optionalInt(field, min, max);
}

std::optional<int64_t> WireReader::optionalInt(const std::string& field,
                                               std::optional<int64_t> min,
                                               std::optional<int64_t> max) {
    const auto* value = find(field);
    if (!value) return std::nullopt;

    if (!value->is_number_integer()) {
        fail(field, "expected an integer");
        return std::nullopt;
    }

    if (value->is_number_unsigned()
        && value->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        fail(field, "integer out of range");
        return std::nullopt;
    }

    auto number = value->get<int64_t>();
    if ((min && number < *min) || (max && number > *max)) {
        std::string bounds = min && max
            ? "between " + std::to_string(*min) + " and " + std::to_string(*max)
            : min ? "at least " + std::to_string(*min) : "at most " + std::to_string(*max);
        fail(field, "must be " + bounds);
        return std::nullopt;
    }
    return number;
}

std::optional<bool> WireReader::requireBool(const std::string& field) {
    const auto* value = findRequired(field);
    if (!value) return std::nullopt;
    if (!value->is_boolean()) {
        fail(field, "expected a boolean");
        return std::nullopt;
    }
    return value->get<bool>();
}

std::optional<bool> WireReader::optionalBool(const std::string& field, bool fallback) {
    if (failed()) return std::nullopt;
    const auto* value = find(field);
    if (!value) return fallback;
    if (!value->is_boolean()) {
        fail(field, "expected a boolean");
        return std::nullopt;
    }
    return value->get<bool>();
}

// ============================================
// UUID / ВРЕМЯ / URL
// ============================================

std::optional<domain::Uuid> WireReader::requireUuid(const std::string& field) {
    auto raw = requireString(field);
    if (!raw) return std::nullopt;

    auto uuid = domain::Uuid::parse(*raw);
    if (!uuid) {
        fail(field, "not a valid UUID: '" + *raw + "'");
    }
    return uuid;
}

std::optional<domain::Timestamp> WireReader::requireTimestamp(const std::string& field) {
    const auto* value = findRequired(field);
    if (!value) return std::nullopt;

    const int64_t limit = domain::Timestamp::MAX_EPOCH_SECONDS;

    // Число секунд от эпохи: JSON число или строка из цифр
    std::optional<int64_t> seconds;
    bool numeric = false;
    if (value->is_number_unsigned()) {
        numeric = true;
        auto number = value->get<uint64_t>();
        if (number <= static_cast<uint64_t>(limit)) {
            seconds = static_cast<int64_t>(number);
        }
    } else if (value->is_number_integer()) {
        numeric = true;
        seconds = value->get<int64_t>();
    } else if (value->is_number_float()) {
        numeric = true;
        double number = value->get<double>();
        if (std::isfinite(number) && std::fabs(number) <= static_cast<double>(limit)) {
            seconds = static_cast<int64_t>(number);
        }
    } else if (value->is_string()) {
        auto str = value->get<std::string>();
        if (!str.empty() && str.find_first_not_of("0123456789") == std::string::npos) {
            numeric = true;
            if (str.size() <= 18) {
                seconds = std::stoll(str);
            }
        } else if (auto parsed = domain::Timestamp::fromString(str)) {
            return parsed;
        }
    }

    if (seconds && domain::Timestamp::isRepresentable(*seconds)) {
        return domain::Timestamp::fromEpochSeconds(*seconds);
    }

    fail(field, numeric ? "timestamp out of range"
                        : "expected an epoch timestamp or ISO 8601 date-time");
    return std::nullopt;
}

std::optional<std::string> WireReader::requireUrl(const std::string& field) {
    if (!findRequired(field)) return std::nullopt;
    return optionalUrl(field);
}

std::optional<std::string> WireReader::optionalUrl(const std::string& field) {
    auto raw = optionalString(field);
    if (!raw) return std::nullopt;
    if (!utils::Url::isValid(*raw)) {
        fail(field, "not a valid URL: '" + *raw + "'");
        return std::nullopt;
    }
    return raw;
}

// ============================================
// КОЛЛЕКЦИИ
// ============================================

std::optional<std::vector<std::string>> WireReader::stringList(const std::string& field) {
    if (failed()) return std::nullopt;
    const auto* value = find(field);
    if (!value) return std::vector<std::string>{};

    if (!value->is_array()) {
        fail(field, "expected an array");
        return std::nullopt;
    }

    std::vector<std::string> result;
    for (size_t i = 0; i < value->size(); ++i) {
        const auto& item = (*value)[i];
        if (!item.is_string()) {
            fail(field + "[" + std::to_string(i) + "]", "expected a string");
            return std::nullopt;
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::optional<nlohmann::json> WireReader::object(const std::string& field) {
    if (failed()) return std::nullopt;
    const auto* value = find(field);
    if (!value) return nlohmann::json::object();

    if (!value->is_object()) {
        fail(field, "expected an object");
        return std::nullopt;
    }
    return *value;
}

} // namespace nimbasms::serialization

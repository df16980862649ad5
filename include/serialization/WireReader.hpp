#pragma once

#include "domain/Error.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Uuid.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace nimbasms::serialization {

/**
 * @brief Чтение полей JSON объекта с накоплением первой ошибки
 *
 * Каждый геттер возвращает optional; после первой ошибки остальные
 * геттеры ничего не читают. Лишние поля объекта игнорируются.
 *
 * @code
 * WireReader r(json);
 * auto sid = r.requireString("sid");
 * auto balance = r.requireInt("balance", 0);
 * if (r.failed()) return r.error();
 * @endcode
 */
class WireReader {
public:
    /**
     * @param json Объект для чтения
     * @param path Префикс имён полей для вложенных объектов ("numbers[0]")
     */
    explicit WireReader(const nlohmann::json& json, std::string path = "");

    bool failed() const { return error_.has_value(); }
    const domain::Error& error() const { return *error_; }

    std::optional<std::string> requireString(const std::string& field, size_t maxLength = 0);
    std::optional<std::string> optionalString(const std::string& field, size_t maxLength = 0);

    std::optional<int64_t> requireInt(const std::string& field,
                                      std::optional<int64_t> min = std::nullopt,
                                      std::optional<int64_t> max = std::nullopt);
    std::optional<int64_t> optionalInt(const std::string& field,
                                       std::optional<int64_t> min = std::nullopt,
                                       std::optional<int64_t> max = std::nullopt);

    std::optional<bool> requireBool(const std::string& field);
    std::optional<bool> optionalBool(const std::string& field, bool fallback);

    std::optional<domain::Uuid> requireUuid(const std::string& field);
    std::optional<domain::Timestamp> requireTimestamp(const std::string& field);

    std::optional<std::string> requireUrl(const std::string& field);
    std::optional<std::string> optionalUrl(const std::string& field);

    std::optional<std::vector<std::string>> stringList(const std::string& field);
    std::optional<nlohmann::json> object(const std::string& field);

    /**
     * @brief Строковое поле-перечисление
     *
     * Неизвестное значение - ошибка декодирования, без подстановки дефолта.
     */
    template <typename Enum>
    std::optional<Enum> requireEnum(const std::string& field,
                                    const std::function<std::optional<Enum>(const std::string&)>& parse) {
        auto raw = requireString(field);
        if (!raw) return std::nullopt;
        return toEnum(field, *raw, parse);
    }

    template <typename Enum>
    std::optional<Enum> optionalEnum(const std::string& field,
                                     const std::function<std::optional<Enum>(const std::string&)>& parse) {
        auto raw = optionalString(field);
        if (!raw) return std::nullopt;
        return toEnum(field, *raw, parse);
    }

    /**
     * @brief Полное имя поля с учётом префикса
     */
    std::string qualify(const std::string& field) const;

    void fail(const std::string& field, const std::string& reason);

private:
    const nlohmann::json& json_;
    std::string path_;
    std::optional<domain::Error> error_;

    const nlohmann::json* find(const std::string& field);
    const nlohmann::json* findRequired(const std::string& field);

    template <typename Enum>
    std::optional<Enum> toEnum(const std::string& field, const std::string& raw,
                               const std::function<std::optional<Enum>(const std::string&)>& parse) {
        auto value = parse(raw);
        if (!value) {
            fail(field, "unknown value '" + raw + "'");
        }
        return value;
    }
};

} // namespace nimbasms::serialization

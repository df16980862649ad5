#pragma once

#include <cctype>
#include <cstdio>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace nimbasms::utils {

/**
 * @brief Разобранный абсолютный http(s) URL
 */
struct Url {
    std::string scheme;     ///< "http" или "https"
    std::string host;
    int port = 0;           ///< Явный или по умолчанию для схемы
    std::string path;       ///< Без завершающего '/', может быть пустым
    std::string query;      ///< Без '?'

    bool isTls() const { return scheme == "https"; }

    /**
     * @brief Разобрать URL
     * @return nullopt если схема не http/https, нет хоста или порт вне диапазона
     */
    static std::optional<Url> parse(const std::string& str) {
        static const std::regex pattern(
            R"(^(https?)://([A-Za-z0-9.\-]+|\[[0-9A-Fa-f:.]+\])(?::(\d{1,5}))?(/[^\s?#]*)?(?:\?([^\s#]*))?(?:#\S*)?$)",
            std::regex::icase);

        std::smatch m;
        if (!std::regex_match(str, m, pattern)) {
            return std::nullopt;
        }

        Url url;
        url.scheme = lower(m[1].str());
        url.host = lower(m[2].str());
        if (url.host.empty() || url.host.front() == '.' || url.host.back() == '.') {
            return std::nullopt;
        }

        if (m[3].matched) {
            url.port = std::stoi(m[3].str());
            if (url.port < 1 || url.port > 65535) {
                return std::nullopt;
            }
        } else {
            url.port = url.isTls() ? 443 : 80;
        }

        url.path = m[4].matched ? m[4].str() : "";
        while (!url.path.empty() && url.path.back() == '/') {
            url.path.pop_back();
        }
        url.query = m[5].matched ? m[5].str() : "";
        return url;
    }

    static bool isValid(const std::string& str) {
        return parse(str).has_value();
    }

private:
    static std::string lower(std::string s) {
        for (char& c : s) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return s;
    }
};

/**
 * @brief Percent-encoding значения query-параметра (RFC 3986, unreserved не кодируются)
 */
inline std::string urlEncode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }
    return result;
}

/**
 * @brief Собрать query string из пар в заданном порядке
 */
inline std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += "&";
        query += urlEncode(key) + "=" + urlEncode(value);
    }
    return query;
}

} // namespace nimbasms::utils

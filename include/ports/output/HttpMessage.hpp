#pragma once

#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace nimbasms::ports::output {

/**
 * @brief HTTP запрос, который шлюз передаёт транспорту
 */
struct HttpRequest {
    std::string method;     ///< "GET", "POST", "PATCH", "DELETE"
    std::string scheme;     ///< "https" / "http"
    std::string host;
    int port = 443;
    std::string target;     ///< Путь + "?" + query
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /**
     * @brief Значение заголовка (без учёта регистра имени), пусто если нет
     */
    std::string header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (key.size() != name.size()) continue;
            bool same = true;
            for (size_t i = 0; i < key.size() && same; ++i) {
                same = std::tolower(static_cast<unsigned char>(key[i]))
                    == std::tolower(static_cast<unsigned char>(name[i]));
            }
            if (same) return value;
        }
        return "";
    }

    std::string path() const {
        return target.substr(0, target.find('?'));
    }

    std::string query() const {
        auto pos = target.find('?');
        return pos == std::string::npos ? "" : target.substr(pos + 1);
    }
};

/**
 * @brief HTTP ответ транспорта
 */
struct HttpResponse {
    int status = 0;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

} // namespace nimbasms::ports::output

#pragma once

#include <optional>
#include <string>

namespace nimbasms::domain {

/**
 * @brief HTTP метод действия расширения
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE
};

inline std::string toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::DELETE: return "DELETE";
        default: return "UNKNOWN";
    }
}

inline std::optional<HttpMethod> parseHttpMethod(const std::string& str) {
    if (str == "GET") return HttpMethod::GET;
    if (str == "POST") return HttpMethod::POST;
    if (str == "PUT") return HttpMethod::PUT;
    if (str == "PATCH") return HttpMethod::PATCH;
    if (str == "DELETE") return HttpMethod::DELETE;
    return std::nullopt;
}

} // namespace nimbasms::domain

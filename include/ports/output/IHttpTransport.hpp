#pragma once

#include "domain/Result.hpp"
#include "ports/output/HttpMessage.hpp"

namespace nimbasms::ports::output {

/**
 * @brief Транспорт: один запрос - один ответ
 *
 * Любой полученный HTTP ответ (включая 4xx/5xx) - успех транспорта.
 * Ошибка возвращается только если ответа нет (DNS, TLS, обрыв) - TRANSPORT.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual domain::Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace nimbasms::ports::output

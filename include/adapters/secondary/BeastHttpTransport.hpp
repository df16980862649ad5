#pragma once

#include "ports/output/IHttpTransport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <memory>
#include <string>

namespace nimbasms::adapters::secondary {

/**
 * @brief Синхронный HTTP/HTTPS транспорт на Boost.Beast
 *
 * TLS через OpenSSL: проверка сертификата по системным корням, SNI,
 * проверка имени хоста. Соединение переиспользуется, пока сервер
 * разрешает keep-alive и запрос идёт на тот же host:port.
 * Повторов при обрыве нет.
 */
class BeastHttpTransport : public ports::output::IHttpTransport {
public:
    BeastHttpTransport();
    ~BeastHttpTransport() override;

    BeastHttpTransport(const BeastHttpTransport&) = delete;
    BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

    domain::Result<ports::output::HttpResponse> send(const ports::output::HttpRequest& request) override;

private:
    using TlsStream = boost::asio::ssl::stream<boost::beast::tcp_stream>;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslContext_;

    // Текущее соединение: ровно один из потоков активен
    std::unique_ptr<boost::beast::tcp_stream> plain_;
    std::unique_ptr<TlsStream> tls_;
    std::string connectedKey_;

    void connect(const ports::output::HttpRequest& request);
    void close();

    template <typename Stream>
    ports::output::HttpResponse exchange(Stream& stream, const ports::output::HttpRequest& request, bool& keepAlive);
};

} // namespace nimbasms::adapters::secondary

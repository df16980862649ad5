#include "adapters/secondary/BeastHttpTransport.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace nimbasms::adapters::secondary {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

using domain::Error;
using domain::Result;
using ports::output::HttpRequest;
using ports::output::HttpResponse;

BeastHttpTransport::BeastHttpTransport()
    : sslContext_(asio::ssl::context::tls_client)
{
    sslContext_.set_options(asio::ssl::context::default_workarounds
                          | asio::ssl::context::no_sslv2
                          | asio::ssl::context::no_sslv3
                          | asio::ssl::context::no_tlsv1
                          | asio::ssl::context::no_tlsv1_1);
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(asio::ssl::verify_peer);
}

BeastHttpTransport::~BeastHttpTransport() {
    close();
}

Result<HttpResponse> BeastHttpTransport::send(const HttpRequest& request) {
    std::string key = request.scheme + "://" + request.host + ":" + std::to_string(request.port);

    try {
        if (connectedKey_ != key) {
            close();
            connect(request);
            connectedKey_ = key;
        }

        bool keepAlive = false;
        HttpResponse response = tls_ ? exchange(*tls_, request, keepAlive)
                                     : exchange(*plain_, request, keepAlive);
        if (!keepAlive) {
            close();
        }
        return response;
    } catch (const boost::system::system_error& e) {
        close();
        return Error::transport(request.host + ": " + e.code().message());
    } catch (const std::exception& e) {
        close();
        return Error::transport(request.host + ": " + e.what());
    }
}

void BeastHttpTransport::connect(const HttpRequest& request) {
    asio::ip::tcp::resolver resolver(ioc_);
    auto endpoints = resolver.resolve(request.host, std::to_string(request.port));

    if (request.scheme == "https") {
        tls_ = std::make_unique<TlsStream>(ioc_, sslContext_);

        // SNI
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), request.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
            throw boost::system::system_error(ec);
        }
        tls_->set_verify_callback(asio::ssl::host_name_verification(request.host));

        beast::get_lowest_layer(*tls_).connect(endpoints);
        tls_->handshake(asio::ssl::stream_base::client);
    } else {
        plain_ = std::make_unique<beast::tcp_stream>(ioc_);
        plain_->connect(endpoints);
    }
}

void BeastHttpTransport::close() {
    beast::error_code ec;
    if (tls_) {
        beast::get_lowest_layer(*tls_).socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(*tls_).close();
        tls_.reset();
    }
    if (plain_) {
        plain_->socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        plain_->close();
        plain_.reset();
    }
    connectedKey_.clear();
}

template <typename Stream>
HttpResponse BeastHttpTransport::exchange(Stream& stream, const HttpRequest& request, bool& keepAlive) {
    http::request<http::string_body> req{http::string_to_verb(request.method), request.target, 11};
    req.set(http::field::host, request.host);
    req.set(http::field::user_agent, "nimbasms-cpp");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.keep_alive(true);
    if (!request.body.empty() || request.method == "POST" || request.method == "PATCH" || request.method == "PUT") {
        req.body() = request.body;
        req.prepare_payload();
    }

    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    keepAlive = res.keep_alive();

    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    response.body = std::move(res.body());
    return response;
}

} // namespace nimbasms::adapters::secondary

#include "genai_pool/connection.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <string>
#include <type_traits>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;

namespace genai_pool {

    namespace {

        Error error_from_ec(const boost::system::error_code& ec,
                            Error::Code stage, const char* what) {
            Error e{};
            e.code = (ec == beast::error::timeout) ? Error::Code::Timeout : stage;
            e.message = std::string(what) + ": " + ec.message();
            return e;
        }

        // What a keep-alive socket the server already dropped produces on
        // first use.
        bool is_stale_socket_error(const boost::system::error_code& ec) {
            return ec == http::error::end_of_stream || ec == net::error::eof ||
                   ec == net::error::connection_reset ||
                   ec == net::error::broken_pipe ||
                   ec == ssl::error::stream_truncated;
        }

    }  // namespace

    Connection::Connection(Endpoint endpoint, ssl::context& ssl_ctx,
                           ConnectionTimeouts timeouts)
        : m_endpoint(std::move(endpoint)),
          m_ssl_ctx(ssl_ctx),
          m_timeouts(timeouts) {
        m_endpoint.normalize();
    }

    Result<Response> Connection::request(
        const http::request<http::string_body>& req, std::size_t body_limit) {
        const bool reused = is_open();

        bool stale = false;
        auto res = exchange(req, body_limit, stale);
        if (res.has_error() && reused && stale) {
            close();
            return exchange(req, body_limit, stale);
        }
        return res;
    }

    Result<Response> Connection::exchange(
        const http::request<http::string_body>& req, std::size_t body_limit,
        bool& stale) {
        stale = false;
        auto connected = ensure_connected();
        if (connected.has_error()) {
            return Result<Response>::err(std::move(connected).error());
        }

        lowest_layer().expires_after(m_timeouts.request);

        boost::system::error_code ec = run_op([&](auto handler) {
            std::visit(
                [&](auto& s) {
                    using T = std::decay_t<decltype(s)>;
                    if constexpr (!std::is_same_v<T, std::monostate>) {
                        http::async_write(s, req, std::move(handler));
                    }
                },
                m_stream);
        });
        if (ec) {
            stale = is_stale_socket_error(ec);
            close();
            return Result<Response>::err(
                error_from_ec(ec, Error::Code::SendFailed, "Write failed"));
        }

        http::response_parser<http::string_body> parser;
        parser.body_limit(body_limit);
        m_buffer.clear();

        ec = run_op([&](auto handler) {
            std::visit(
                [&](auto& s) {
                    using T = std::decay_t<decltype(s)>;
                    if constexpr (!std::is_same_v<T, std::monostate>) {
                        http::async_read(s, m_buffer, parser,
                                         std::move(handler));
                    }
                },
                m_stream);
        });
        if (ec) {
            // Only a read that produced nothing at all can be replayed.
            stale = is_stale_socket_error(ec) && !parser.got_some();
            close();
            return Result<Response>::err(
                error_from_ec(ec, Error::Code::ReceiveFailed, "Read failed"));
        }

        auto beast_res = parser.release();
        if (!beast_res.keep_alive()) close();

        return Result<Response>::ok(parse_beast_response(std::move(beast_res)));
    }

    Result<bool> Connection::ensure_connected() {
        if (is_open()) return Result<bool>::ok(true);

        close();

        boost::system::error_code ec;
        auto results = m_resolver.resolve(m_endpoint.host, m_endpoint.port, ec);
        if (ec) {
            return Result<bool>::err(error_from_ec(
                ec, Error::Code::ConnectionFailed, "Resolve failed"));
        }

        if (!m_endpoint.https) {
            auto& s = m_stream.emplace<HttpStream>(m_ioc);
            s.expires_after(m_timeouts.connect);
            ec = run_op(
                [&](auto handler) { s.async_connect(results, std::move(handler)); });
            if (ec) {
                close();
                return Result<bool>::err(error_from_ec(
                    ec, Error::Code::ConnectionFailed, "Connect failed"));
            }
            return Result<bool>::ok(false);
        }

        auto& s = m_stream.emplace<HttpsStream>(m_ioc, m_ssl_ctx);

        if (!set_sni(s, m_endpoint.host, ec)) {
            close();
            return Result<bool>::err(error_from_ec(
                ec, Error::Code::TlsHandshakeFailed, "SNI setup failed"));
        }

        beast::get_lowest_layer(s).expires_after(m_timeouts.connect);
        ec = run_op([&](auto handler) {
            beast::get_lowest_layer(s).async_connect(results, std::move(handler));
        });
        if (ec) {
            close();
            return Result<bool>::err(error_from_ec(
                ec, Error::Code::ConnectionFailed, "Connect failed"));
        }

        ec = run_op([&](auto handler) {
            s.async_handshake(ssl::stream_base::client, std::move(handler));
        });
        if (ec) {
            close();
            return Result<bool>::err(error_from_ec(
                ec, Error::Code::TlsHandshakeFailed, "TLS handshake failed"));
        }

        return Result<bool>::ok(false);
    }

    void Connection::close() noexcept {
        boost::system::error_code ec;

        if (std::holds_alternative<HttpStream>(m_stream)) {
            auto& s = std::get<HttpStream>(m_stream);
            s.socket().shutdown(tcp::socket::shutdown_both, ec);
            s.socket().close(ec);
        } else if (std::holds_alternative<HttpsStream>(m_stream)) {
            // No TLS close_notify; just drop the underlying TCP socket.
            auto& s = std::get<HttpsStream>(m_stream);
            beast::get_lowest_layer(s).socket().shutdown(
                tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(s).socket().close(ec);
        }

        m_stream.emplace<std::monostate>();
    }

    bool Connection::is_open() const noexcept {
        return std::visit(
            [](auto const& s) -> bool {
                using T = std::decay_t<decltype(s)>;

                if constexpr (std::is_same_v<T, std::monostate>) {
                    return false;
                } else if constexpr (std::is_same_v<T, HttpStream>) {
                    return s.socket().is_open();
                } else {
                    return beast::get_lowest_layer(s).socket().is_open();
                }
            },
            m_stream);
    }

    beast::tcp_stream& Connection::lowest_layer() {
        if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            return beast::get_lowest_layer(*s);
        }
        return std::get<HttpStream>(m_stream);
    }

}  // namespace genai_pool

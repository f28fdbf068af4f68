#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <variant>

#include "endpoint.hpp"
#include "response.hpp"
#include "result.hpp"

namespace genai_pool {

    /** @brief Deadlines applied by a Connection. */
    struct ConnectionTimeouts {
        /** @brief Covers TCP connect and the TLS handshake. */
        std::chrono::milliseconds connect{10000};
        /** @brief Covers writing the request and reading the response. */
        std::chrono::milliseconds request{120000};
    };

    /**
     * @brief One keep-alive HTTP/HTTPS connection to a fixed endpoint.
     *
     * Blocking API driven by a private io_context so that the tcp_stream
     * deadlines apply. Not thread-safe; the owner serializes access.
     */
    class Connection {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

       public:
        /**
         * @brief Constructs a Connection. Nothing is opened until the first
         * request.
         * @param endpoint The target endpoint.
         * @param ssl_ctx The SSL context for HTTPS; must outlive the
         * connection.
         * @param timeouts Connect and request deadlines.
         */
        Connection(Endpoint endpoint, boost::asio::ssl::context& ssl_ctx,
                   ConnectionTimeouts timeouts = {});

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        ~Connection() noexcept { close(); }

        /**
         * @brief Sends one request and reads the response, connecting first if
         * needed. A request that fails on a reused keep-alive socket is
         * retried once on a fresh connection, since the server may have
         * dropped the idle socket.
         * @param req The fully prepared request.
         * @param body_limit Maximum accepted response body size.
         */
        Result<Response> request(
            const boost::beast::http::request<boost::beast::http::string_body>&
                req,
            std::size_t body_limit);

        /// @brief Close the socket if open (best-effort).
        void close() noexcept;

        /// @brief Checks if the underlying socket is currently open.
        [[nodiscard]] bool is_open() const noexcept;

        [[nodiscard]] const Endpoint& endpoint() const noexcept {
            return m_endpoint;
        }

       private:
        Result<Response> exchange(
            const boost::beast::http::request<boost::beast::http::string_body>&
                req,
            std::size_t body_limit, bool& stale);

        Result<bool> ensure_connected();

        /// @brief Start an async operation and run the io_context until it
        /// completes; the tcp_stream deadline bounds the wait.
        template <typename Initiate>
        boost::system::error_code run_op(Initiate&& initiate) {
            boost::system::error_code result =
                boost::asio::error::would_block;
            initiate([&result](boost::system::error_code ec, auto&&...) {
                result = ec;
            });
            m_ioc.restart();
            m_ioc.run();
            return result;
        }

        boost::beast::tcp_stream& lowest_layer();

        Endpoint m_endpoint;
        boost::asio::ssl::context& m_ssl_ctx;
        ConnectionTimeouts m_timeouts;

        boost::asio::io_context m_ioc{1};
        tcp::resolver m_resolver{m_ioc};
        boost::beast::flat_buffer m_buffer{};
        Stream m_stream;
    };

}  // namespace genai_pool

#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cctype>
#include <stdexcept>
#include <string>

#include "url.hpp"

namespace genai_pool {

    struct Endpoint {
        std::string host;
        std::string port;
        bool https{true};

        inline void normalize() {
            if (port.empty()) port = https ? "443" : "80";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }
    };

    inline Endpoint endpoint_from_url(const UrlComponents& u) {
        Endpoint ep;
        ep.host = u.host;
        ep.port = u.port;
        ep.https = u.https;
        ep.normalize();
        return ep;
    }

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system CA store and set the verification mode.
    /// @throws std::runtime_error if the CA store cannot be loaded.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        bool verify_peer) {
        if (!verify_peer) {
            ssl_context.set_verify_mode(boost::asio::ssl::verify_none);
            return;
        }
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }
        ssl_context.set_verify_mode(boost::asio::ssl::verify_peer);
    }

}  // namespace genai_pool

#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace genai_pool {

    /// @brief An outgoing HTTP request before interceptors ran. `target` is
    /// the path plus optional query, relative to the service endpoint.
    struct Request {
        boost::beast::http::verb method{boost::beast::http::verb::post};
        std::string target;
        std::unordered_map<std::string, std::string> headers;
        std::optional<std::string> body;
    };

    /// @brief Apply Request headers into a Boost.Beast header container.
    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    inline void apply_request_headers(
        const std::unordered_map<std::string, std::string>& in,
        boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const Request& req, const std::string& host,
                          const std::string& user_agent,
                          const bool keep_alive = true) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(req.method);
        beast_req.target(req.target);
        beast_req.set(http::field::host, host);
        beast_req.set(http::field::user_agent, user_agent);
        beast_req.keep_alive(keep_alive);
        apply_request_headers(req.headers, beast_req.base());
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
            beast_req.prepare_payload();
        }
        return beast_req;
    }

}  // namespace genai_pool

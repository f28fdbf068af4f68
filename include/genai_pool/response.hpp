#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <string>
#include <unordered_map>

namespace genai_pool {

    /**
     * @brief Represents an HTTP response from the service.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 429). */
        int status_code{0};
        /** @brief HTTP response headers, keys as sent by the server. */
        std::unordered_map<std::string, std::string> headers;
        /** @brief HTTP response body as a string. */
        std::string body;

        [[nodiscard]] bool ok() const noexcept {
            return status_code >= 200 && status_code < 300;
        }
    };

    /// @brief Convert a Boost.Beast HTTP response to a Response.
    /// @note If duplicate header keys occur, the first one wins.
    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&&
            beast_res) {
        Response out;
        out.status_code = static_cast<int>(beast_res.result_int());

        for (const auto& field : beast_res.base()) {
            out.headers.emplace(std::string(field.name_string()),
                                std::string(field.value()));
        }

        out.body = std::move(beast_res.body());
        return out;
    }

}  // namespace genai_pool

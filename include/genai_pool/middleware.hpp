#pragma once

#include <string>
#include <utility>

#include "request.hpp"

namespace genai_pool {

    /**
     * @brief Interface for modifying requests right before they are sent.
     */
    class RequestInterceptor {
       public:
        virtual ~RequestInterceptor() = default;

        /**
         * @brief Performs modifications on the outgoing request.
         * @param req The request object to modify.
         */
        virtual void prepare(Request& req) const = 0;
    };

    /**
     * @brief Attaches an API key header to every request, e.g.
     * `x-goog-api-key` for the Gemini API.
     */
    class ApiKeyInterceptor : public RequestInterceptor {
       public:
        /**
         * @param header The header name.
         * @param value The API key itself.
         */
        ApiKeyInterceptor(std::string header, std::string value)
            : m_header(std::move(header)), m_value(std::move(value)) {}

        void prepare(Request& req) const override {
            req.headers[m_header] = m_value;
        }

       private:
        std::string m_header;
        std::string m_value;
    };

}  // namespace genai_pool

#pragma once

#include <boost/asio/ssl/context.hpp>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "connection.hpp"
#include "generative_client.hpp"
#include "middleware.hpp"
#include "payload.hpp"
#include "response.hpp"
#include "result.hpp"
#include "url.hpp"

namespace genai_pool {

    /**
     * @brief GenerativeClient for the Gemini `generateContent` REST endpoint,
     * authenticated with one API key.
     *
     * Holds a single keep-alive connection; concurrent generate() calls on the
     * same instance are serialized on it.
     */
    class GeminiClient : public GenerativeClient {
       public:
        /**
         * @param api_key Key sent in the `x-goog-api-key` header.
         * @param config Service location, timeouts and limits.
         * @throws std::invalid_argument if config.base_url cannot be parsed.
         */
        GeminiClient(std::string api_key, ServiceConfiguration config);

        GeminiClient(const GeminiClient&) = delete;
        GeminiClient& operator=(const GeminiClient&) = delete;

        /**
         * @brief POSTs payload to `models/{model}:generateContent`.
         * @return The concatenated candidate text, or an Error whose code is
         * RateLimited / ResourceExhausted for quota rejections.
         */
        Result<std::string> generate(const std::string& model,
                                     const Payload& payload) override;

        [[nodiscard]] const ServiceConfiguration& config() const noexcept {
            return m_config;
        }

       private:
        ServiceConfiguration m_config;
        UrlComponents m_base;
        ApiKeyInterceptor m_auth;

        boost::asio::ssl::context m_ssl_context{
            boost::asio::ssl::context::tls_client};

        std::mutex m_mutex;
        Connection m_conn;
    };

    namespace gemini {

        /// @brief Request target for a model, e.g.
        /// `/v1beta/models/gemini-3-flash-preview:generateContent`.
        std::string generate_content_target(const UrlComponents& base,
                                            std::string_view api_version,
                                            std::string_view model);

        /// @brief JSON body for a generateContent call.
        nlohmann::json build_generate_request(const Payload& payload);

        /// @brief Turn an HTTP response into text or a classified Error.
        ///
        /// 429 maps to RateLimited, or to ResourceExhausted when the
        /// QuotaFailure details name a per-day quota. Any other non-2xx status
        /// is a ServiceError. A 2xx body without candidate text is an
        /// EmptyResponse; unparsable JSON is an InvalidResponse.
        Result<std::string> parse_generate_response(const Response& response);

    }  // namespace gemini

}  // namespace genai_pool

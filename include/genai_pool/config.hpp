#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "model_table.hpp"
#include "result.hpp"

namespace genai_pool {
    /**
     * @brief Configuration for the credential scheduler.
     */
    struct SchedulerConfiguration {
        /** @brief Consecutive non-rate-limit failures that retire a credential. */
        std::size_t error_threshold{3};
    };

    /**
     * @brief Configuration for the retry loop of the CallExecutor.
     */
    struct RetryConfiguration {
        /** @brief Attempts per call, including the first one. */
        std::size_t max_attempts{3};

        /** @brief Fixed delay between two attempts of the same call. */
        std::chrono::milliseconds retry_delay{1000};

        /** @brief Cooldown applied to a key after a rate-limit failure. */
        std::chrono::seconds rate_limit_cooldown{60};

        /** @brief Cooldown applied to a key after a quota-exhaustion failure. */
        std::chrono::seconds exhaustion_cooldown{300};
    };

    /**
     * @brief Configuration for the Gemini REST transport.
     */
    struct ServiceConfiguration {
        /** @brief Scheme, host and optional port of the service. */
        std::string base_url{"https://generativelanguage.googleapis.com"};

        /** @brief API version path segment. */
        std::string api_version{"v1beta"};

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"genai_pool/1.0"};

        /** @brief Timeout for resolving and establishing a connection. */
        std::chrono::milliseconds connect_timeout{10000};

        /** @brief Timeout for one request/response exchange. Media analysis
         * can take a while, so this is generous. */
        std::chrono::milliseconds request_timeout{120000};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(16) * 1024U * 1024U};

        /** @brief Whether to verify TLS certificates. */
        bool verify_tls{true};
    };

    /**
     * @brief Everything a Gateway needs to be built.
     */
    struct GatewayConfiguration {
        /** @brief API keys in rotation order. */
        std::vector<std::string> credentials;

        SchedulerConfiguration scheduler;
        RetryConfiguration retry;
        ServiceConfiguration service;
        ModelTable models{ModelTable::defaults()};
    };

    /// @brief Split a comma-separated key list, trimming whitespace and
    /// dropping empty entries.
    std::vector<std::string> parse_credential_list(std::string_view csv);

    /// @brief Build a GatewayConfiguration from the process environment.
    ///
    /// Reads GOOGLE_API_KEY (one key or a comma-separated list) and the
    /// optional GENAI_POOL_* overrides. A missing key list is not an error
    /// here: the resulting pool reports itself unusable.
    Result<GatewayConfiguration> load_gateway_configuration_from_env();

}  // namespace genai_pool

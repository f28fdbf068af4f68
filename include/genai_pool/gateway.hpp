#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_executor.hpp"
#include "client_cache.hpp"
#include "config.hpp"
#include "credential_pool.hpp"
#include "payload.hpp"
#include "result.hpp"

namespace genai_pool {

    /**
     * @brief Owns the pool, the client cache and the executor for one
     * application.
     *
     * Construct one at startup and hand it to every collaborator by
     * reference. All members are thread-safe.
     */
    class Gateway {
       public:
        /**
         * @brief Builds a gateway whose clients talk to the Gemini REST API.
         * @throws std::invalid_argument if config.service.base_url is invalid.
         */
        explicit Gateway(GatewayConfiguration config);

        /**
         * @brief Builds a gateway around a custom client factory.
         * @param config Credentials and tuning; config.service is unused.
         * @param factory Creates one client per credential.
         * @param sleep Backoff primitive, defaults to a real sleep.
         * @param now Clock for cooldowns, defaults to steady_clock.
         */
        Gateway(GatewayConfiguration config, ClientCache::factory_type factory,
                CallExecutor::sleep_fn sleep = {},
                CredentialPool::now_fn now = {});

        /**
         * @brief Like the first constructor, but reports a missing key list or
         * an invalid base URL as an Error instead of building an unusable
         * gateway.
         */
        static Result<std::unique_ptr<Gateway>> create(
            GatewayConfiguration config);

        Gateway(const Gateway&) = delete;
        Gateway& operator=(const Gateway&) = delete;

        /// @copydoc CallExecutor::execute
        [[nodiscard]] Result<std::string> execute(std::string_view purpose_tag,
                                                  const Payload& payload) {
            return m_executor.execute(purpose_tag, payload);
        }

        [[nodiscard]] Result<std::string> call_orchestrator(
            const Payload& payload) {
            return m_executor.call_orchestrator(payload);
        }

        [[nodiscard]] Result<std::string> call_vision(const Payload& payload) {
            return m_executor.call_vision(payload);
        }

        [[nodiscard]] std::vector<CredentialSnapshot> status() const {
            return m_pool.status();
        }

        [[nodiscard]] nlohmann::json status_json() const {
            return m_pool.status_json();
        }

        [[nodiscard]] bool usable() const noexcept { return m_pool.usable(); }

        CredentialPool& pool() noexcept { return m_pool; }
        ClientCache& clients() noexcept { return m_clients; }

       private:
        CredentialPool m_pool;
        ClientCache m_clients;
        CallExecutor m_executor;
    };

}  // namespace genai_pool

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

#include "client_cache.hpp"
#include "config.hpp"
#include "credential_pool.hpp"
#include "model_table.hpp"
#include "payload.hpp"
#include "result.hpp"

namespace genai_pool {

    /**
     * @brief The single entry point collaborators call.
     *
     * Hides rotation and retries: each execute() selects a key, calls the
     * service through that key's cached client, feeds the outcome back into
     * the pool, and retries on a fixed delay. Thread-safe; state shared
     * between calls lives in the CredentialPool and the ClientCache.
     */
    class CallExecutor {
       public:
        using sleep_fn = std::function<void(std::chrono::milliseconds)>;

        /**
         * @param pool Scheduler shared by every collaborator.
         * @param clients Client cache shared by every collaborator.
         * @param models Purpose to model mapping.
         * @param retry Attempts, delay and cooldowns.
         * @param sleep Backoff primitive; tests inject a recorder.
         */
        CallExecutor(CredentialPool& pool, ClientCache& clients,
                     ModelTable models, RetryConfiguration retry = {},
                     sleep_fn sleep = {});

        /**
         * @brief Runs one call for purpose, rotating keys and retrying.
         * @return The response text on success. Otherwise NoCredentials when
         * the pool is empty (the service is never contacted), EmptyResponse
         * as soon as the service answers without content (not retried, the
         * key stays healthy), or CallFailedAfterRetries carrying the last
         * attempt's error message.
         */
        [[nodiscard]] Result<std::string> execute(std::string_view purpose_tag,
                                                  const Payload& payload);

        [[nodiscard]] Result<std::string> call_orchestrator(
            const Payload& payload) {
            return execute(purpose::orchestrator, payload);
        }

        [[nodiscard]] Result<std::string> call_vision(const Payload& payload) {
            return execute(purpose::vision, payload);
        }

        [[nodiscard]] const RetryConfiguration& retry_config() const noexcept {
            return m_retry;
        }

        [[nodiscard]] const ModelTable& models() const noexcept {
            return m_models;
        }

       private:
        Result<std::string> attempt(const SelectedCredential& credential,
                                    const std::string& model,
                                    const Payload& payload);
        void record_failure(const SelectedCredential& credential,
                            const Error& error);

        CredentialPool& m_pool;
        ClientCache& m_clients;
        ModelTable m_models;
        RetryConfiguration m_retry;
        sleep_fn m_sleep;
    };

}  // namespace genai_pool

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "credential.hpp"
#include "result.hpp"

namespace genai_pool {

    /**
     * @brief Round-robin scheduler over a fixed set of API keys.
     *
     * Selection and every state transition run under one mutex that guards
     * the cursor and all credential fields. None of the operations block on
     * I/O or wait for a cooldown; callers sleep (if at all) outside the lock.
     *
     * The set of credentials is fixed at construction. An empty set is
     * accepted but leaves the pool unusable: select() then reports
     * Error::Code::NoCredentials.
     */
    class CredentialPool {
       public:
        using now_fn = std::function<clock_type::time_point()>;

        /**
         * @brief Constructs a pool; secrets are kept in the given order.
         * @param secrets API keys in rotation order.
         * @param config Scheduler tuning.
         * @param now Clock used for cooldowns. Tests inject a manual clock.
         */
        explicit CredentialPool(std::vector<std::string> secrets,
                                SchedulerConfiguration config = {},
                                now_fn now = &clock_type::now);

        CredentialPool(const CredentialPool&) = delete;
        CredentialPool& operator=(const CredentialPool&) = delete;

        /**
         * @brief Picks the next usable credential.
         *
         * Scans at most size() positions starting at the cursor; the cursor
         * advances once per examined credential whether or not it is chosen.
         * A rate-limited credential whose cooldown has elapsed is flipped back
         * to Available (error count reset) and returned.
         *
         * @return The chosen credential, PoolExhausted when the scan found
         * nothing, or NoCredentials for an empty pool.
         */
        [[nodiscard]] Result<SelectedCredential> select();

        /// @brief Park a credential for cooldown and count the failure.
        void mark_rate_limited(std::size_t index, std::chrono::seconds cooldown);

        /// @brief Count a non-rate-limit failure; retires the credential once
        /// the configured threshold is reached.
        void mark_error(std::size_t index);

        /// @brief Record a successful call: stamps last_used and clears the
        /// error count. Status is left untouched.
        void mark_success(std::size_t index);

        /// @brief Snapshot of every credential in index order.
        [[nodiscard]] std::vector<CredentialSnapshot> status() const;

        /// @brief Same snapshot as JSON:
        /// `{"key_1": {"status": "available", "error_count": 0,
        /// "cooldown_remaining_s": 0}, ...}`
        [[nodiscard]] nlohmann::json status_json() const;

        [[nodiscard]] std::size_t size() const noexcept {
            return m_credentials.size();
        }

        /// @brief False when the pool was built without credentials.
        [[nodiscard]] bool usable() const noexcept {
            return !m_credentials.empty();
        }

        /// @brief Credentials currently Available (cooldowns not re-evaluated).
        [[nodiscard]] std::size_t available_count() const;

        [[nodiscard]] const SchedulerConfiguration& config() const noexcept {
            return m_config;
        }

       private:
        Credential* find_locked(std::size_t index, const char* operation);

        SchedulerConfiguration m_config;
        now_fn m_now;

        mutable std::mutex m_mutex;
        std::vector<Credential> m_credentials;
        std::size_t m_cursor{0};
    };

}  // namespace genai_pool

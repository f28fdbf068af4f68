#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace genai_pool {

    using clock_type = std::chrono::steady_clock;

    /// @brief Lifecycle state of a credential.
    enum class CredentialStatus : std::uint8_t {
        Available,    ///< Selectable
        RateLimited,  ///< Selectable again once cooldown_until has passed
        Error,        ///< Retired for the life of the pool
    };

    inline const char* to_string(CredentialStatus status) {
        switch (status) {
            case CredentialStatus::Available:
                return "available";
            case CredentialStatus::RateLimited:
                return "rate_limited";
            case CredentialStatus::Error:
                return "error";
        }
        return "unknown";
    }

    /**
     * @brief One API key in the rotation, together with its state.
     *
     * Owned by the CredentialPool and only mutated under its lock.
     */
    struct Credential {
        std::string secret;
        std::size_t index{0};
        CredentialStatus status{CredentialStatus::Available};
        /// Informational only.
        clock_type::time_point last_used{};
        std::size_t error_count{0};
        /// Meaningful only while status is RateLimited.
        clock_type::time_point cooldown_until{};
    };

    /// @brief What select() hands out: enough to build a client and to report
    /// the outcome back to the pool.
    struct SelectedCredential {
        std::size_t index{0};
        std::string secret;
    };

    /// @brief Point-in-time view of one credential for dashboards. Never
    /// carries the secret.
    struct CredentialSnapshot {
        std::string display_name;
        std::size_t index{0};
        CredentialStatus status{CredentialStatus::Available};
        std::size_t error_count{0};
        std::chrono::seconds cooldown_remaining{0};
    };

    /// @brief Stable name shown for a credential, "key_1" for index 0.
    inline std::string display_name(std::size_t index) {
        return "key_" + std::to_string(index + 1);
    }

}  // namespace genai_pool

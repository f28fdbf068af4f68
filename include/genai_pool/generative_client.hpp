#pragma once

#include <cstdint>
#include <string>

#include "error.hpp"
#include "payload.hpp"
#include "result.hpp"

namespace genai_pool {

    /// @brief How the executor reacts to a failed attempt.
    enum class FailureKind : std::uint8_t {
        RateLimit,          ///< Short cooldown on the key
        ResourceExhausted,  ///< Long cooldown on the key
        Transient,          ///< Counts towards retiring the key
        NoContent,          ///< Key worked; the reply carried nothing usable
    };

    inline const char* to_string(FailureKind kind) {
        switch (kind) {
            case FailureKind::RateLimit:
                return "RateLimit";
            case FailureKind::ResourceExhausted:
                return "ResourceExhausted";
            case FailureKind::Transient:
                return "Transient";
            case FailureKind::NoContent:
                return "NoContent";
        }
        return "Unknown";
    }

    /// @brief Map a transport error onto the executor's failure taxonomy.
    /// Transports are expected to set RateLimited / ResourceExhausted codes
    /// themselves. EmptyResponse is a property of the payload (a blocked
    /// prompt), not of the key; everything else is transient.
    inline constexpr FailureKind classify_failure(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::RateLimited:
                return FailureKind::RateLimit;
            case Error::Code::ResourceExhausted:
                return FailureKind::ResourceExhausted;
            case Error::Code::EmptyResponse:
                return FailureKind::NoContent;
            default:
                return FailureKind::Transient;
        }
    }

    inline FailureKind classify_failure(const Error& error) noexcept {
        return classify_failure(error.code);
    }

    /**
     * @brief One authenticated handle to the inference service.
     *
     * The ClientCache keeps one instance per credential. Implementations must
     * tolerate concurrent generate() calls (serializing internally is fine)
     * and must report failures through the returned Result rather than by
     * throwing.
     */
    class GenerativeClient {
       public:
        virtual ~GenerativeClient() = default;

        /**
         * @brief Runs one generation request.
         * @param model Backend model identifier.
         * @param payload Prompt parts and generation options.
         * @return The response text, or a classified Error.
         */
        virtual Result<std::string> generate(const std::string& model,
                                             const Payload& payload) = 0;
    };

}  // namespace genai_pool

#pragma once
#include <string>

namespace genai_pool {
    /**
     * @brief Represents a failure reported by the transport, the scheduler or
     * the call executor.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,        /**< The configured URL is malformed or invalid. */
            ConnectionFailed,  /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed,/**< Failed to perform TLS handshake. */
            Timeout,           /**< The operation timed out. */
            SendFailed,        /**< Failed to send the request. */
            ReceiveFailed,     /**< Failed to receive the response. */
            NetworkError,      /**< General network error. */
            RateLimited,       /**< Service rejected the key with a short-term rate limit. */
            ResourceExhausted, /**< Service reports a long-term quota as used up. */
            ServiceError,      /**< Service answered with any other non-2xx status. */
            InvalidResponse,   /**< Response body could not be parsed. */
            EmptyResponse,     /**< Response parsed but carried no candidate text. */
            PoolExhausted,     /**< A full rotation scan found no selectable credential. */
            NoCredentials,     /**< The pool was constructed without credentials. */
            CallFailedAfterRetries, /**< Every attempt of a call failed. */
            InvalidConfiguration,   /**< A configuration value could not be parsed. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code{Code::Unknown};
        /** @brief A descriptive error message. */
        std::string message;
        /** @brief HTTP status of the failing response, 0 when none was received. */
        int http_status{0};
    };

    /// @brief Convert an Error::Code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::RateLimited:
                return "RateLimited";
            case Error::Code::ResourceExhausted:
                return "ResourceExhausted";
            case Error::Code::ServiceError:
                return "ServiceError";
            case Error::Code::InvalidResponse:
                return "InvalidResponse";
            case Error::Code::EmptyResponse:
                return "EmptyResponse";
            case Error::Code::PoolExhausted:
                return "PoolExhausted";
            case Error::Code::NoCredentials:
                return "NoCredentials";
            case Error::Code::CallFailedAfterRetries:
                return "CallFailedAfterRetries";
            case Error::Code::InvalidConfiguration:
                return "InvalidConfiguration";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace genai_pool

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "credential.hpp"
#include "generative_client.hpp"

namespace genai_pool {

    /**
     * @brief Lazily builds and keeps one GenerativeClient per credential.
     *
     * Entries are created on first use and live as long as the cache; there is
     * no eviction or refresh. A client whose key has been revoked simply stops
     * being used once the pool retires that key.
     */
    class ClientCache {
       public:
        using factory_type = std::function<std::unique_ptr<GenerativeClient>(
            const SelectedCredential&)>;

        explicit ClientCache(factory_type factory);

        ClientCache(const ClientCache&) = delete;
        ClientCache& operator=(const ClientCache&) = delete;

        /**
         * @brief Returns the client for credential.index, creating it on the
         * first request.
         * @note The reference stays valid for the lifetime of the cache. Do
         * not keep it across calls.
         * @throws std::logic_error if the factory returns null.
         */
        [[nodiscard]] GenerativeClient& get(const SelectedCredential& credential);

        /// @brief Number of clients materialized so far.
        [[nodiscard]] std::size_t size() const;

       private:
        factory_type m_factory;

        mutable std::mutex m_mutex;
        std::unordered_map<std::size_t, std::unique_ptr<GenerativeClient>>
            m_clients;
    };

}  // namespace genai_pool

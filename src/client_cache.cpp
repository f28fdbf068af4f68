#include "genai_pool/client_cache.hpp"

#include <stdexcept>
#include <utility>

#include "genai_pool/log.hpp"

namespace genai_pool {

    ClientCache::ClientCache(factory_type factory)
        : m_factory(std::move(factory)) {
        if (!m_factory) {
            throw std::invalid_argument("ClientCache requires a client factory");
        }
    }

    GenerativeClient& ClientCache::get(const SelectedCredential& credential) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_clients.find(credential.index);
        if (it != m_clients.end()) return *it->second;

        // Construction is local setup only (no network I/O), so it is done
        // under the lock to guarantee exactly one client per key.
        auto client = m_factory(credential);
        if (!client) {
            throw std::logic_error("client factory returned null for " +
                                   display_name(credential.index));
        }
        logger()->debug("created client for {}", display_name(credential.index));
        auto [pos, inserted] =
            m_clients.emplace(credential.index, std::move(client));
        (void)inserted;
        return *pos->second;
    }

    std::size_t ClientCache::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_clients.size();
    }

}  // namespace genai_pool

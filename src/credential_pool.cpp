#include "genai_pool/credential_pool.hpp"

#include <algorithm>
#include <utility>

#include "genai_pool/log.hpp"

namespace genai_pool {

    CredentialPool::CredentialPool(std::vector<std::string> secrets,
                                   SchedulerConfiguration config, now_fn now)
        : m_config(config), m_now(std::move(now)) {
        if (!m_now) m_now = &clock_type::now;

        m_credentials.reserve(secrets.size());
        for (std::size_t i = 0; i < secrets.size(); ++i) {
            Credential c;
            c.secret = std::move(secrets[i]);
            c.index = i;
            m_credentials.push_back(std::move(c));
        }

        if (m_credentials.empty()) {
            logger()->error(
                "credential pool constructed without API keys; every call "
                "will fail until keys are configured");
        } else {
            logger()->info("credential pool ready with {} key(s)",
                           m_credentials.size());
        }
    }

    Result<SelectedCredential> CredentialPool::select() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_credentials.empty()) {
            return Result<SelectedCredential>::err(
                Error::Code::NoCredentials, "No API keys configured");
        }

        const auto now = m_now();
        const std::size_t n = m_credentials.size();

        for (std::size_t scanned = 0; scanned < n; ++scanned) {
            Credential& c = m_credentials[m_cursor];
            m_cursor = (m_cursor + 1) % n;

            switch (c.status) {
                case CredentialStatus::Available:
                    logger()->debug("selected {}", display_name(c.index));
                    return Result<SelectedCredential>::ok(
                        SelectedCredential{c.index, c.secret});

                case CredentialStatus::RateLimited:
                    if (now >= c.cooldown_until) {
                        c.status = CredentialStatus::Available;
                        c.error_count = 0;
                        logger()->info("{} cooled down, back in rotation",
                                       display_name(c.index));
                        return Result<SelectedCredential>::ok(
                            SelectedCredential{c.index, c.secret});
                    }
                    break;

                case CredentialStatus::Error:
                    break;
            }
        }

        logger()->warn("all {} API key(s) exhausted or rate limited", n);
        return Result<SelectedCredential>::err(
            Error::Code::PoolExhausted,
            "All API keys exhausted or rate limited");
    }

    void CredentialPool::mark_rate_limited(std::size_t index,
                                           std::chrono::seconds cooldown) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Credential* c = find_locked(index, "mark_rate_limited");
        if (!c) return;

        ++c->error_count;
        // Error is terminal; a late 429 from an in-flight call on a retired
        // key only counts the failure.
        if (c->status == CredentialStatus::Error) {
            logger()->debug("{} already retired, rate limit ignored",
                            display_name(index));
            return;
        }
        c->status = CredentialStatus::RateLimited;
        c->cooldown_until = m_now() + cooldown;
        logger()->warn("{} rate limited for {}s (errors: {})",
                       display_name(index), cooldown.count(), c->error_count);
    }

    void CredentialPool::mark_error(std::size_t index) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Credential* c = find_locked(index, "mark_error");
        if (!c) return;

        ++c->error_count;
        if (c->error_count >= m_config.error_threshold &&
            c->status != CredentialStatus::Error) {
            c->status = CredentialStatus::Error;
            logger()->error("{} removed from rotation after {} errors",
                            display_name(index), c->error_count);
        }
    }

    void CredentialPool::mark_success(std::size_t index) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Credential* c = find_locked(index, "mark_success");
        if (!c) return;

        c->last_used = m_now();
        c->error_count = 0;
    }

    std::vector<CredentialSnapshot> CredentialPool::status() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_now();

        std::vector<CredentialSnapshot> out;
        out.reserve(m_credentials.size());
        for (const auto& c : m_credentials) {
            CredentialSnapshot s;
            s.display_name = display_name(c.index);
            s.index = c.index;
            s.status = c.status;
            s.error_count = c.error_count;
            if (c.status == CredentialStatus::RateLimited &&
                c.cooldown_until > now) {
                // Round up so a pending cooldown never reads as 0.
                s.cooldown_remaining =
                    std::chrono::ceil<std::chrono::seconds>(c.cooldown_until -
                                                            now);
            }
            out.push_back(std::move(s));
        }
        return out;
    }

    nlohmann::json CredentialPool::status_json() const {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& s : status()) {
            out[s.display_name] = {
                {"status", to_string(s.status)},
                {"error_count", s.error_count},
                {"cooldown_remaining_s", s.cooldown_remaining.count()},
            };
        }
        return out;
    }

    std::size_t CredentialPool::available_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<std::size_t>(
            std::count_if(m_credentials.begin(), m_credentials.end(),
                          [](const Credential& c) {
                              return c.status == CredentialStatus::Available;
                          }));
    }

    Credential* CredentialPool::find_locked(std::size_t index,
                                            const char* operation) {
        if (index >= m_credentials.size()) {
            logger()->warn("{} called with unknown key index {}", operation,
                           index);
            return nullptr;
        }
        return &m_credentials[index];
    }

}  // namespace genai_pool

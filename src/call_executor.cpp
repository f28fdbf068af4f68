#include "genai_pool/call_executor.hpp"

#include <exception>
#include <thread>
#include <utility>

#include "genai_pool/generative_client.hpp"
#include "genai_pool/log.hpp"

namespace genai_pool {

    CallExecutor::CallExecutor(CredentialPool& pool, ClientCache& clients,
                               ModelTable models, RetryConfiguration retry,
                               sleep_fn sleep)
        : m_pool(pool),
          m_clients(clients),
          m_models(std::move(models)),
          m_retry(retry),
          m_sleep(std::move(sleep)) {
        if (!m_sleep) {
            m_sleep = [](std::chrono::milliseconds d) {
                std::this_thread::sleep_for(d);
            };
        }
    }

    Result<std::string> CallExecutor::execute(std::string_view purpose_tag,
                                              const Payload& payload) {
        if (!m_pool.usable()) {
            return Result<std::string>::err(Error::Code::NoCredentials,
                                            "No API keys configured");
        }

        const std::string model = m_models.resolve(purpose_tag);
        Error last_error{Error::Code::Unknown, "no attempt was made"};

        for (std::size_t attempt_no = 1; attempt_no <= m_retry.max_attempts;
             ++attempt_no) {
            auto selected = m_pool.select();
            if (selected.has_error()) {
                last_error = std::move(selected).error();
            } else {
                const SelectedCredential& credential = selected.value();
                auto res = attempt(credential, model, payload);
                if (res.has_value()) {
                    m_pool.mark_success(credential.index);
                    return res;
                }
                last_error = std::move(res).error();
                record_failure(credential, last_error);
                // Another key would get the same reply for the same payload.
                if (classify_failure(last_error) == FailureKind::NoContent) {
                    return Result<std::string>::err(std::move(last_error));
                }
            }

            if (attempt_no < m_retry.max_attempts) {
                m_sleep(m_retry.retry_delay);
            }
        }

        logger()->error("{} call failed after {} attempt(s): {}", purpose_tag,
                        m_retry.max_attempts, last_error.message);
        return Result<std::string>::err(
            Error::Code::CallFailedAfterRetries,
            "Call failed after " + std::to_string(m_retry.max_attempts) +
                " attempt(s); last error (" + to_string(last_error.code) +
                "): " + last_error.message,
            last_error.http_status);
    }

    Result<std::string> CallExecutor::attempt(
        const SelectedCredential& credential, const std::string& model,
        const Payload& payload) {
        try {
            GenerativeClient& client = m_clients.get(credential);
            return client.generate(model, payload);
        } catch (const std::exception& e) {
            // Clients report through Result; anything thrown is unexpected
            // and is charged to the key like any other transient failure.
            return Result<std::string>::err(Error::Code::Unknown, e.what());
        }
    }

    void CallExecutor::record_failure(const SelectedCredential& credential,
                                      const Error& error) {
        switch (classify_failure(error)) {
            case FailureKind::RateLimit:
                m_pool.mark_rate_limited(credential.index,
                                         m_retry.rate_limit_cooldown);
                break;
            case FailureKind::ResourceExhausted:
                m_pool.mark_rate_limited(credential.index,
                                         m_retry.exhaustion_cooldown);
                break;
            case FailureKind::Transient:
                logger()->error("{} failed ({}): {}",
                                display_name(credential.index),
                                to_string(error.code), error.message);
                m_pool.mark_error(credential.index);
                break;
            case FailureKind::NoContent:
                logger()->warn("{} returned no content: {}",
                               display_name(credential.index), error.message);
                m_pool.mark_success(credential.index);
                break;
        }
    }

}  // namespace genai_pool

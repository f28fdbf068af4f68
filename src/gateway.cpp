#include "genai_pool/gateway.hpp"

#include <stdexcept>
#include <utility>

#include "genai_pool/gemini_client.hpp"
#include "genai_pool/url.hpp"

namespace genai_pool {

    namespace {

        ClientCache::factory_type gemini_factory(ServiceConfiguration service) {
            if (auto parsed = url_utils::parse_base_url(service.base_url);
                !parsed) {
                throw std::invalid_argument("Invalid base_url: " +
                                            parsed.error().message);
            }
            return [service = std::move(service)](
                       const SelectedCredential& credential)
                       -> std::unique_ptr<GenerativeClient> {
                return std::make_unique<GeminiClient>(credential.secret,
                                                      service);
            };
        }

    }  // namespace

    Gateway::Gateway(GatewayConfiguration config)
        : Gateway(config, gemini_factory(config.service)) {}

    Gateway::Gateway(GatewayConfiguration config,
                     ClientCache::factory_type factory,
                     CallExecutor::sleep_fn sleep, CredentialPool::now_fn now)
        : m_pool(std::move(config.credentials), config.scheduler,
                 std::move(now)),
          m_clients(std::move(factory)),
          m_executor(m_pool, m_clients, std::move(config.models), config.retry,
                     std::move(sleep)) {}

    Result<std::unique_ptr<Gateway>> Gateway::create(
        GatewayConfiguration config) {
        if (config.credentials.empty()) {
            return Result<std::unique_ptr<Gateway>>::err(
                Error::Code::NoCredentials,
                "No API keys configured. Set GOOGLE_API_KEY.");
        }
        if (auto parsed = url_utils::parse_base_url(config.service.base_url);
            !parsed) {
            return Result<std::unique_ptr<Gateway>>::err(
                Error::Code::InvalidConfiguration,
                "Invalid base_url: " + parsed.error().message);
        }
        return Result<std::unique_ptr<Gateway>>::ok(
            std::make_unique<Gateway>(std::move(config)));
    }

}  // namespace genai_pool

#include "genai_pool/config.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>

#include "genai_pool/log.hpp"
#include "genai_pool/url.hpp"

namespace genai_pool {

    namespace {

        std::string_view trim(std::string_view s) {
            const auto is_space = [](char c) {
                return c == ' ' || c == '\t' || c == '\r' || c == '\n';
            };
            while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
            while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
            return s;
        }

        std::optional<std::string_view> env(const char* name) {
            const char* v = std::getenv(name);
            if (v == nullptr) return std::nullopt;
            std::string_view sv = trim(v);
            if (sv.empty()) return std::nullopt;
            return sv;
        }

        // Reads a positive integer override; absent variables leave out
        // untouched.
        Result<bool> read_positive(const char* name, long long& out) {
            auto raw = env(name);
            if (!raw) return Result<bool>::ok(false);

            long long value = 0;
            const char* first = raw->data();
            const char* last = first + raw->size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last || value <= 0) {
                return Result<bool>::err(
                    Error::Code::InvalidConfiguration,
                    std::string(name) + " must be a positive integer, got '" +
                        std::string(*raw) + "'");
            }
            out = value;
            return Result<bool>::ok(true);
        }

    }  // namespace

    std::vector<std::string> parse_credential_list(std::string_view csv) {
        std::vector<std::string> out;
        while (!csv.empty()) {
            const auto comma = csv.find(',');
            std::string_view item = trim(csv.substr(0, comma));
            if (!item.empty()) out.emplace_back(item);
            if (comma == std::string_view::npos) break;
            csv.remove_prefix(comma + 1);
        }
        return out;
    }

    Result<GatewayConfiguration> load_gateway_configuration_from_env() {
        GatewayConfiguration cfg;

        if (auto keys = env("GOOGLE_API_KEY")) {
            cfg.credentials = parse_credential_list(*keys);
        }
        if (cfg.credentials.empty()) {
            logger()->warn("No GOOGLE_API_KEY found in environment");
        }

        long long v = 0;
        auto fail = [](Result<bool>&& r) {
            return Result<GatewayConfiguration>::err(std::move(r).error());
        };

        if (auto r = read_positive("GENAI_POOL_RATE_LIMIT_COOLDOWN", v); !r) {
            return fail(std::move(r));
        } else if (r.value()) {
            cfg.retry.rate_limit_cooldown = std::chrono::seconds(v);
        }

        if (auto r = read_positive("GENAI_POOL_EXHAUSTION_COOLDOWN", v); !r) {
            return fail(std::move(r));
        } else if (r.value()) {
            cfg.retry.exhaustion_cooldown = std::chrono::seconds(v);
        }

        if (auto r = read_positive("GENAI_POOL_MAX_ATTEMPTS", v); !r) {
            return fail(std::move(r));
        } else if (r.value()) {
            cfg.retry.max_attempts = static_cast<std::size_t>(v);
        }

        if (auto r = read_positive("GENAI_POOL_ERROR_THRESHOLD", v); !r) {
            return fail(std::move(r));
        } else if (r.value()) {
            cfg.scheduler.error_threshold = static_cast<std::size_t>(v);
        }

        if (auto r = read_positive("GENAI_POOL_RETRY_DELAY_MS", v); !r) {
            return fail(std::move(r));
        } else if (r.value()) {
            cfg.retry.retry_delay = std::chrono::milliseconds(v);
        }

        if (auto base = env("GENAI_POOL_BASE_URL")) {
            if (auto parsed = url_utils::parse_base_url(*base); !parsed) {
                return Result<GatewayConfiguration>::err(
                    Error::Code::InvalidConfiguration,
                    "GENAI_POOL_BASE_URL: " + parsed.error().message);
            }
            cfg.service.base_url = std::string(*base);
        }

        return Result<GatewayConfiguration>::ok(std::move(cfg));
    }

}  // namespace genai_pool

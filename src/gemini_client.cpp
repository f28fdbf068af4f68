#include "genai_pool/gemini_client.hpp"

#include <simdjson.h>

#include <boost/beast/core/detail/base64.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "genai_pool/endpoint.hpp"
#include "genai_pool/request.hpp"

namespace http = boost::beast::http;
using nlohmann::json;

namespace genai_pool {

    namespace {

        UrlComponents parse_base_or_throw(const std::string& base_url) {
            auto res = url_utils::parse_base_url(base_url);
            if (res.has_error()) {
                throw std::invalid_argument("Invalid base_url: " +
                                            res.error().message);
            }
            return std::move(res).value();
        }

        std::string base64_encode(const std::string& bytes) {
            namespace b64 = boost::beast::detail::base64;
            std::string out(b64::encoded_size(bytes.size()), '\0');
            out.resize(b64::encode(out.data(), bytes.data(), bytes.size()));
            return out;
        }

        json part_to_json(const Part& part) {
            return std::visit(
                [](const auto& p) -> json {
                    using T = std::decay_t<decltype(p)>;
                    if constexpr (std::is_same_v<T, std::string>) {
                        return json{{"text", p}};
                    } else {
                        return json{{"inlineData",
                                     {{"mimeType", p.mime_type},
                                      {"data", base64_encode(p.bytes)}}}};
                    }
                },
                part);
        }

        // Error body shape:
        // {"error": {"code": 429, "message": "...", "status": "RESOURCE_EXHAUSTED",
        //  "details": [{"@type": ".../google.rpc.QuotaFailure",
        //               "violations": [{"quotaId": "...PerDay..."}]}]}}
        struct ServiceErrorBody {
            std::string message;
            std::string status;
            bool per_day_quota{false};
        };

        ServiceErrorBody parse_error_body(const std::string& body) {
            ServiceErrorBody out;

            static thread_local simdjson::ondemand::parser parser;
            simdjson::padded_string padded(body);
            simdjson::ondemand::document doc;
            if (parser.iterate(padded).get(doc)) return out;

            simdjson::ondemand::object err;
            if (doc["error"].get_object().get(err)) return out;

            std::string_view sv;
            if (!err["message"].get_string().get(sv)) out.message = std::string(sv);
            if (!err["status"].get_string().get(sv)) out.status = std::string(sv);

            simdjson::ondemand::array details;
            if (err["details"].get_array().get(details)) return out;

            for (auto detail_res : details) {
                simdjson::ondemand::object detail;
                if (detail_res.get_object().get(detail)) continue;

                std::string_view type;
                if (detail["@type"].get_string().get(type)) continue;
                if (type.find("QuotaFailure") == std::string_view::npos) continue;

                simdjson::ondemand::array violations;
                if (detail["violations"].get_array().get(violations)) continue;

                for (auto violation_res : violations) {
                    simdjson::ondemand::object violation;
                    if (violation_res.get_object().get(violation)) continue;
                    std::string_view quota_id;
                    if (!violation["quotaId"].get_string().get(quota_id) &&
                        quota_id.find("PerDay") != std::string_view::npos) {
                        out.per_day_quota = true;
                    }
                }
            }
            return out;
        }

        Result<std::string> error_from_status(const Response& response) {
            ServiceErrorBody body = parse_error_body(response.body);

            std::string message = "HTTP " + std::to_string(response.status_code);
            if (!body.status.empty()) message += " " + body.status;
            if (!body.message.empty()) message += ": " + body.message;

            Error::Code code = Error::Code::ServiceError;
            if (response.status_code == 429) {
                code = body.per_day_quota ? Error::Code::ResourceExhausted
                                          : Error::Code::RateLimited;
            }
            return Result<std::string>::err(code, std::move(message),
                                            response.status_code);
        }

    }  // namespace

    namespace gemini {

        std::string generate_content_target(const UrlComponents& base,
                                            std::string_view api_version,
                                            std::string_view model) {
            std::string target = base.target;
            target += '/';
            target += api_version;
            target += "/models/";
            target += url_utils::url_encode(model);
            target += ":generateContent";
            return target;
        }

        json build_generate_request(const Payload& payload) {
            json parts = json::array();
            for (const auto& part : payload.parts) {
                parts.push_back(part_to_json(part));
            }

            json body;
            body["contents"] =
                json::array({json{{"role", "user"}, {"parts", std::move(parts)}}});

            const GenerationOptions& o = payload.options;
            if (o.system_instruction) {
                body["systemInstruction"] = {
                    {"parts", json::array({json{{"text", *o.system_instruction}}})}};
            }

            json cfg = json::object();
            if (o.temperature) cfg["temperature"] = *o.temperature;
            if (o.top_p) cfg["topP"] = *o.top_p;
            if (o.max_output_tokens) cfg["maxOutputTokens"] = *o.max_output_tokens;
            if (o.response_mime_type) cfg["responseMimeType"] = *o.response_mime_type;
            if (o.response_schema) cfg["responseSchema"] = *o.response_schema;
            if (!cfg.empty()) body["generationConfig"] = std::move(cfg);

            return body;
        }

        Result<std::string> parse_generate_response(const Response& response) {
            if (!response.ok()) return error_from_status(response);

            auto invalid = [&](const char* what) {
                return Result<std::string>::err(Error::Code::InvalidResponse,
                                                what, response.status_code);
            };

            static thread_local simdjson::ondemand::parser parser;
            simdjson::padded_string padded(response.body);
            simdjson::ondemand::document doc;
            if (parser.iterate(padded).get(doc)) {
                return invalid("Response is not JSON");
            }

            simdjson::ondemand::object root;
            if (doc.get_object().get(root)) {
                return invalid("Response is not a JSON object");
            }

            simdjson::ondemand::array candidates;
            auto cand_err = root["candidates"].get_array().get(candidates);
            if (cand_err == simdjson::NO_SUCH_FIELD) {
                return Result<std::string>::err(
                    Error::Code::EmptyResponse,
                    "Response has no candidates (prompt blocked?)",
                    response.status_code);
            }
            if (cand_err) return invalid("Malformed candidates array");

            std::string text;
            bool saw_text = false;
            for (auto candidate_res : candidates) {
                simdjson::ondemand::object candidate;
                if (candidate_res.get_object().get(candidate)) {
                    return invalid("Malformed candidate");
                }

                simdjson::ondemand::array parts;
                if (candidate["content"]["parts"].get_array().get(parts)) break;

                for (auto part_res : parts) {
                    simdjson::ondemand::object part;
                    if (part_res.get_object().get(part)) {
                        return invalid("Malformed content part");
                    }
                    bool thought = false;
                    if (part["thought"].get_bool().get(thought)) thought = false;
                    if (thought) continue;

                    std::string_view sv;
                    if (!part["text"].get_string().get(sv)) {
                        text.append(sv);
                        saw_text = true;
                    }
                }
                // Only the first candidate is used.
                break;
            }

            if (!saw_text) {
                return Result<std::string>::err(
                    Error::Code::EmptyResponse,
                    "Response candidate carries no text", response.status_code);
            }
            return Result<std::string>::ok(std::move(text));
        }

    }  // namespace gemini

    GeminiClient::GeminiClient(std::string api_key, ServiceConfiguration config)
        : m_config(std::move(config)),
          m_base(parse_base_or_throw(m_config.base_url)),
          m_auth("x-goog-api-key", std::move(api_key)),
          m_conn(endpoint_from_url(m_base), m_ssl_context,
                 ConnectionTimeouts{m_config.connect_timeout,
                                    m_config.request_timeout}) {
        init_tls_on_ssl_context(m_ssl_context, m_config.verify_tls);
    }

    Result<std::string> GeminiClient::generate(const std::string& model,
                                               const Payload& payload) {
        Request req;
        req.method = http::verb::post;
        req.target =
            gemini::generate_content_target(m_base, m_config.api_version, model);
        req.headers["Content-Type"] = "application/json";
        req.body = gemini::build_generate_request(payload).dump();
        m_auth.prepare(req);

        const bool default_port = (m_base.https && m_base.port == "443") ||
                                  (!m_base.https && m_base.port == "80");
        const std::string host_header =
            default_port ? m_base.host : m_base.host + ":" + m_base.port;
        auto beast_req =
            prepare_beast_request(req, host_header, m_config.user_agent);

        Result<Response> res = [&] {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_conn.request(beast_req, m_config.max_body_bytes);
        }();
        if (res.has_error()) return Result<std::string>::err(std::move(res).error());

        return gemini::parse_generate_response(res.value());
    }

}  // namespace genai_pool

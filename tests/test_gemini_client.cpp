#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "genai_pool/gateway.hpp"
#include "genai_pool/gemini_client.hpp"
#include "genai_pool/middleware.hpp"
#include "genai_pool/request.hpp"
#include "httplib.h"

using namespace genai_pool;
using nlohmann::json;
using namespace std::chrono_literals;

namespace {

    constexpr const char* kGeneratePath =
        R"(/v1beta/models/([^/]+):generateContent)";

    Response make_response(int status, std::string body) {
        Response r;
        r.status_code = status;
        r.body = std::move(body);
        return r;
    }

    std::string candidate_body(const std::string& text) {
        return json{{"candidates",
                     json::array({json{{"content",
                                        {{"role", "model"},
                                         {"parts", json::array({json{
                                                       {"text", text}}})}}}}})}}
            .dump();
    }

    std::string rate_limit_body(const std::string& quota_id) {
        json violation = {{"quotaMetric", "generate_content_requests"},
                          {"quotaId", quota_id}};
        json detail = {{"@type", "type.googleapis.com/google.rpc.QuotaFailure"},
                       {"violations", json::array({violation})}};
        return json{{"error",
                     {{"code", 429},
                      {"message", "Resource has been exhausted"},
                      {"status", "RESOURCE_EXHAUSTED"},
                      {"details", json::array({detail})}}}}
            .dump();
    }

    // Serves a scripted Gemini endpoint on 127.0.0.1 for the life of the test.
    class MockGemini {
       public:
        using Handler =
            std::function<void(const httplib::Request&, httplib::Response&)>;

        explicit MockGemini(Handler handler) : m_handler(std::move(handler)) {
            m_server.Post(kGeneratePath, [this](const httplib::Request& req,
                                                httplib::Response& res) {
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_keys.push_back(req.get_header_value("x-goog-api-key"));
                    m_models.push_back(req.matches[1].str());
                    m_bodies.push_back(req.body);
                }
                m_handler(req, res);
            });
            m_port = m_server.bind_to_any_port("127.0.0.1");
            m_thread = std::thread([this] { m_server.listen_after_bind(); });
        }

        ~MockGemini() {
            m_server.stop();
            if (m_thread.joinable()) m_thread.join();
        }

        std::string base_url() const {
            return "http://127.0.0.1:" + std::to_string(m_port);
        }

        std::vector<std::string> keys() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_keys;
        }

        std::vector<std::string> models() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_models;
        }

        std::vector<std::string> bodies() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_bodies;
        }

       private:
        Handler m_handler;
        httplib::Server m_server;
        int m_port{0};
        std::thread m_thread;

        mutable std::mutex m_mutex;
        std::vector<std::string> m_keys;
        std::vector<std::string> m_models;
        std::vector<std::string> m_bodies;
    };

    ServiceConfiguration local_service(const std::string& base_url) {
        ServiceConfiguration cfg;
        cfg.base_url = base_url;
        cfg.connect_timeout = 2000ms;
        cfg.request_timeout = 5000ms;
        return cfg;
    }

    // A port nothing listens on: bind an ephemeral port, then release it.
    unsigned short unused_port() {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor acceptor(
            ioc, boost::asio::ip::tcp::endpoint(
                     boost::asio::ip::make_address("127.0.0.1"), 0));
        return acceptor.local_endpoint().port();
    }

}  // namespace

// ---------------------------------------------------------------------------
// Request building
// ---------------------------------------------------------------------------

TEST(GeminiRequestTest, TargetIncludesVersionAndModel) {
    auto base = url_utils::parse_base_url("https://example.com").value();
    EXPECT_EQ(gemini::generate_content_target(base, "v1beta", "gemini-3-pro-preview"),
              "/v1beta/models/gemini-3-pro-preview:generateContent");

    auto proxied = url_utils::parse_base_url("http://localhost:8080/proxy/").value();
    EXPECT_EQ(gemini::generate_content_target(proxied, "v1", "m"),
              "/proxy/v1/models/m:generateContent");
}

TEST(GeminiRequestTest, TextPromptBody) {
    auto body = gemini::build_generate_request(Payload::text("hello"));

    ASSERT_TRUE(body["contents"].is_array());
    ASSERT_EQ(body["contents"].size(), 1u);
    EXPECT_EQ(body["contents"][0]["role"], "user");
    EXPECT_EQ(body["contents"][0]["parts"][0]["text"], "hello");
    EXPECT_FALSE(body.contains("generationConfig"));
    EXPECT_FALSE(body.contains("systemInstruction"));
}

TEST(GeminiRequestTest, MediaIsBase64Inline) {
    auto body = gemini::build_generate_request(
        Payload::media("image/jpeg", "abc", "what is this?"));

    const auto& parts = body["contents"][0]["parts"];
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0]["inlineData"]["mimeType"], "image/jpeg");
    EXPECT_EQ(parts[0]["inlineData"]["data"], "YWJj");
    EXPECT_EQ(parts[1]["text"], "what is this?");
}

TEST(GeminiRequestTest, OptionsMapToGenerationConfig) {
    Payload p = Payload::text("plan");
    p.options.system_instruction = "You are a director.";
    p.options.temperature = 0.5;
    p.options.top_p = 0.9;
    p.options.max_output_tokens = 256;
    p.options.response_mime_type = "application/json";
    p.options.response_schema = json{{"type", "OBJECT"}};

    auto body = gemini::build_generate_request(p);

    EXPECT_EQ(body["systemInstruction"]["parts"][0]["text"], "You are a director.");
    const auto& cfg = body["generationConfig"];
    EXPECT_DOUBLE_EQ(cfg["temperature"].get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(cfg["topP"].get<double>(), 0.9);
    EXPECT_EQ(cfg["maxOutputTokens"], 256);
    EXPECT_EQ(cfg["responseMimeType"], "application/json");
    EXPECT_EQ(cfg["responseSchema"]["type"], "OBJECT");
}

TEST(ApiKeyInterceptorTest, HeaderPlacement) {
    Request req;
    req.target = "/v1beta/models/m:generateContent";
    ApiKeyInterceptor("x-goog-api-key", "secret").prepare(req);

    EXPECT_EQ(req.headers.at("x-goog-api-key"), "secret");
    EXPECT_EQ(req.target, "/v1beta/models/m:generateContent");
}

// ---------------------------------------------------------------------------
// Response parsing
// ---------------------------------------------------------------------------

TEST(GeminiResponseTest, ConcatenatesFirstCandidateParts) {
    json body = {{"candidates",
                  json::array({json{{"content",
                                     {{"parts", json::array({json{{"text", "Hello, "}},
                                                             json{{"text", "world"}}})}}}},
                               json{{"content",
                                     {{"parts", json::array({json{{"text", "ignored"}}})}}}}})}};

    auto r = gemini::parse_generate_response(make_response(200, body.dump()));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r.value(), "Hello, world");
}

TEST(GeminiResponseTest, SkipsThoughtParts) {
    json body = {{"candidates",
                  json::array({json{{"content",
                                     {{"parts", json::array({json{{"text", "thinking..."},
                                                                  {"thought", true}},
                                                             json{{"text", "answer"}}})}}}}})}};

    auto r = gemini::parse_generate_response(make_response(200, body.dump()));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r.value(), "answer");
}

TEST(GeminiResponseTest, PlainRateLimit) {
    auto r = gemini::parse_generate_response(
        make_response(429, rate_limit_body("GenerateRequestsPerMinutePerProjectPerModel")));

    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::RateLimited);
    EXPECT_EQ(r.error().http_status, 429);
    EXPECT_NE(r.error().message.find("RESOURCE_EXHAUSTED"), std::string::npos);
    EXPECT_EQ(classify_failure(r.error()), FailureKind::RateLimit);
}

TEST(GeminiResponseTest, DailyQuotaIsResourceExhausted) {
    auto r = gemini::parse_generate_response(
        make_response(429, rate_limit_body("GenerateRequestsPerDayPerProjectPerModel")));

    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::ResourceExhausted);
    EXPECT_EQ(classify_failure(r.error()), FailureKind::ResourceExhausted);
}

TEST(GeminiResponseTest, RateLimitWithoutBody) {
    auto r = gemini::parse_generate_response(make_response(429, ""));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::RateLimited);
}

TEST(GeminiResponseTest, OtherStatusIsServiceError) {
    auto r = gemini::parse_generate_response(make_response(
        500, R"({"error":{"code":500,"message":"boom","status":"INTERNAL"}})"));

    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::ServiceError);
    EXPECT_EQ(r.error().http_status, 500);
    EXPECT_EQ(r.error().message, "HTTP 500 INTERNAL: boom");
    EXPECT_EQ(classify_failure(r.error()), FailureKind::Transient);
}

TEST(GeminiResponseTest, MissingCandidatesIsEmpty) {
    auto r = gemini::parse_generate_response(
        make_response(200, R"({"promptFeedback":{"blockReason":"SAFETY"}})"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::EmptyResponse);
    EXPECT_EQ(classify_failure(r.error()), FailureKind::NoContent);
}

TEST(GeminiResponseTest, CandidateWithoutTextIsEmpty) {
    auto r = gemini::parse_generate_response(
        make_response(200, R"({"candidates":[{"finishReason":"SAFETY"}]})"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::EmptyResponse);
}

TEST(GeminiResponseTest, GarbageIsInvalid) {
    auto r = gemini::parse_generate_response(make_response(200, "not json at all"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidResponse);
}

// ---------------------------------------------------------------------------
// Over the wire
// ---------------------------------------------------------------------------

TEST(GeminiClientTest, RejectsInvalidBaseUrl) {
    EXPECT_THROW(GeminiClient("k", local_service("not a url")),
                 std::invalid_argument);
}

TEST(GeminiClientTest, SendsKeyModelAndBody) {
    MockGemini server([](const httplib::Request&, httplib::Response& res) {
        res.set_content(candidate_body("a cat"), "application/json");
    });

    GeminiClient client("key-123", local_service(server.base_url()));
    auto r = client.generate("gemini-3-flash-preview",
                             Payload::media("image/png", "xyz", "describe"));

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r.value(), "a cat");

    ASSERT_EQ(server.keys().size(), 1u);
    EXPECT_EQ(server.keys()[0], "key-123");
    EXPECT_EQ(server.models()[0], "gemini-3-flash-preview");

    auto sent = json::parse(server.bodies()[0]);
    EXPECT_EQ(sent["contents"][0]["parts"][0]["inlineData"]["mimeType"], "image/png");
    EXPECT_EQ(sent["contents"][0]["parts"][1]["text"], "describe");
}

TEST(GeminiClientTest, ReusesConnectionAcrossCalls) {
    MockGemini server([](const httplib::Request&, httplib::Response& res) {
        res.set_content(candidate_body("ok"), "application/json");
    });

    GeminiClient client("k", local_service(server.base_url()));
    for (int i = 0; i < 3; ++i) {
        auto r = client.generate("m", Payload::text("x"));
        ASSERT_TRUE(r.has_value()) << r.error().message;
    }
    EXPECT_EQ(server.keys().size(), 3u);
}

TEST(GeminiClientTest, MapsRateLimitStatus) {
    MockGemini server([](const httplib::Request&, httplib::Response& res) {
        res.status = 429;
        res.set_content(rate_limit_body("PerMinute"), "application/json");
    });

    GeminiClient client("k", local_service(server.base_url()));
    auto r = client.generate("m", Payload::text("x"));

    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::RateLimited);
    EXPECT_EQ(r.error().http_status, 429);
}

TEST(GeminiClientTest, ConnectionRefused) {
    auto cfg = local_service("http://127.0.0.1:" + std::to_string(unused_port()));
    GeminiClient client("k", cfg);

    auto r = client.generate("m", Payload::text("x"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
    EXPECT_EQ(classify_failure(r.error()), FailureKind::Transient);
}

TEST(GeminiClientTest, ConcurrentCallsShareOneClient) {
    std::atomic<int> served{0};
    MockGemini server([&served](const httplib::Request&, httplib::Response& res) {
        served.fetch_add(1);
        res.set_content(candidate_body("ok"), "application/json");
    });

    GeminiClient client("k", local_service(server.base_url()));
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                if (client.generate("m", Payload::text("x")).has_value()) {
                    ok.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), 20);
    EXPECT_EQ(served.load(), 20);
}

// ---------------------------------------------------------------------------
// Gateway end to end
// ---------------------------------------------------------------------------

TEST(GatewayWireTest, RotatesAwayFromRateLimitedKey) {
    MockGemini server([](const httplib::Request& req, httplib::Response& res) {
        if (req.get_header_value("x-goog-api-key") == "key-A") {
            res.status = 429;
            res.set_content(rate_limit_body("PerMinute"), "application/json");
            return;
        }
        res.set_content(candidate_body("from B"), "application/json");
    });

    GatewayConfiguration cfg;
    cfg.credentials = {"key-A", "key-B"};
    cfg.retry.retry_delay = 0ms;
    cfg.service = local_service(server.base_url());

    auto created = Gateway::create(cfg);
    ASSERT_TRUE(created.has_value()) << created.error().message;
    Gateway& gateway = *created.value();

    auto r = gateway.call_orchestrator(Payload::text("plan the edit"));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r.value(), "from B");

    EXPECT_EQ(server.keys(), (std::vector<std::string>{"key-A", "key-B"}));
    EXPECT_EQ(server.models()[1], "gemini-3-flash-preview");

    auto status = gateway.status();
    EXPECT_EQ(status[0].status, CredentialStatus::RateLimited);
    EXPECT_EQ(status[1].status, CredentialStatus::Available);

    // Key A is cooling down, so the next call goes straight to B.
    auto again = gateway.call_vision(Payload::text("describe"));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(server.keys().size(), 3u);
    EXPECT_EQ(server.keys()[2], "key-B");
}

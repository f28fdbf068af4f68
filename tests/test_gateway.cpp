#include <gtest/gtest.h>

#include <stdexcept>

#include "fake_clients.hpp"
#include "genai_pool/gateway.hpp"

using namespace genai_pool;
using namespace std::chrono_literals;
using namespace genai_pool::test_support;

namespace {

    GatewayConfiguration config_with(std::size_t n) {
        GatewayConfiguration cfg;
        cfg.credentials = keys(n);
        return cfg;
    }

}  // namespace

TEST(GatewayTest, RoutesCallsThroughCustomFactory) {
    auto script = std::make_shared<Script>();
    SleepRecorder sleeper;
    Gateway gateway(config_with(2), scripted_factory(script), sleeper.fn());

    auto a = gateway.call_orchestrator(Payload::text("plan"));
    auto b = gateway.call_vision(Payload::text("look"));
    auto c = gateway.execute(purpose::pro, Payload::text("think"));

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(a.value(), "ok:0");
    EXPECT_EQ(b.value(), "ok:1");
    EXPECT_EQ(c.value(), "ok:0");

    auto calls = script->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[2].model, "gemini-3-pro-preview");
    EXPECT_EQ(gateway.clients().size(), 2u);
}

TEST(GatewayTest, ConfigurationFlowsIntoPoolAndExecutor) {
    auto script = std::make_shared<Script>();
    script->always_fail(0, Error{Error::Code::ServiceError, "HTTP 503", 503});
    SleepRecorder sleeper;
    ManualClock clock;

    auto cfg = config_with(1);
    cfg.scheduler.error_threshold = 2;
    cfg.retry.max_attempts = 2;
    cfg.retry.retry_delay = 10ms;
    Gateway gateway(cfg, scripted_factory(script), sleeper.fn(), clock.fn());

    auto r = gateway.call_vision(Payload::text("x"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::CallFailedAfterRetries);
    EXPECT_EQ(gateway.status().at(0).status, CredentialStatus::Error);
    ASSERT_EQ(sleeper.sleeps->size(), 1u);
    EXPECT_EQ(sleeper.sleeps->at(0), 10ms);
}

TEST(GatewayTest, StatusJsonReflectsPool) {
    auto script = std::make_shared<Script>();
    ManualClock clock;
    Gateway gateway(config_with(2), scripted_factory(script), {}, clock.fn());

    gateway.pool().mark_rate_limited(0, 60s);

    auto j = gateway.status_json();
    EXPECT_EQ(j["key_1"]["status"], "rate_limited");
    EXPECT_EQ(j["key_1"]["cooldown_remaining_s"], 60);
    EXPECT_EQ(j["key_2"]["status"], "available");
    EXPECT_TRUE(gateway.usable());
}

TEST(GatewayTest, EmptyKeyListIsUnusable) {
    auto script = std::make_shared<Script>();
    Gateway gateway(GatewayConfiguration{}, scripted_factory(script));

    EXPECT_FALSE(gateway.usable());
    auto r = gateway.call_orchestrator(Payload::text("x"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::NoCredentials);
    EXPECT_EQ(script->call_count(), 0u);
}

TEST(GatewayTest, CreateRejectsEmptyKeyList) {
    auto r = Gateway::create(GatewayConfiguration{});
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::NoCredentials);
}

TEST(GatewayTest, CreateRejectsInvalidBaseUrl) {
    auto cfg = config_with(1);
    cfg.service.base_url = "localhost:8080";

    auto r = Gateway::create(cfg);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidConfiguration);
}

TEST(GatewayTest, CreateBuildsGeminiGateway) {
    auto r = Gateway::create(config_with(3));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_TRUE(r.value()->usable());
    EXPECT_EQ(r.value()->status().size(), 3u);
    // Clients are built lazily; nothing is connected yet.
    EXPECT_EQ(r.value()->clients().size(), 0u);
}

TEST(GatewayTest, ConstructorThrowsOnInvalidBaseUrl) {
    auto cfg = config_with(1);
    cfg.service.base_url = "ftp://nope";
    EXPECT_THROW(Gateway{cfg}, std::invalid_argument);
}

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "genai_pool/call_executor.hpp"
#include "genai_pool/client_cache.hpp"
#include "genai_pool/credential_pool.hpp"
#include "genai_pool/gateway.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;
using steady = std::chrono::steady_clock;

namespace {

    // Per-operation latencies; reported as percentiles plus throughput.
    struct Samples {
        std::vector<std::chrono::nanoseconds> latencies;

        template <typename F>
        void time(F&& op) {
            const auto t0 = steady::now();
            op();
            latencies.push_back(steady::now() - t0);
        }

        void report(const char* label) {
            if (latencies.empty()) return;
            std::sort(latencies.begin(), latencies.end());
            auto us = [](std::chrono::nanoseconds d) {
                return std::chrono::duration<double, std::micro>(d).count();
            };
            auto pct = [&](double p) {
                return latencies[static_cast<std::size_t>(
                    p * static_cast<double>(latencies.size() - 1))];
            };
            std::cout << "\n[ PERF ] " << label << "\n        n="
                      << latencies.size() << std::fixed << std::setprecision(2)
                      << " p50_us=" << us(pct(0.50))
                      << " p99_us=" << us(pct(0.99))
                      << " max_us=" << us(latencies.back()) << "\n";
        }
    };

    // Runs body(thread_index) on `threads` threads and returns wall time.
    std::chrono::nanoseconds run_workers(int threads,
                                         const std::function<void(int)>& body) {
        std::vector<std::thread> workers;
        const auto t0 = steady::now();
        for (int t = 0; t < threads; ++t) workers.emplace_back(body, t);
        for (auto& w : workers) w.join();
        return steady::now() - t0;
    }

    void report_throughput(const char* label, int threads, std::uint64_t ops,
                           std::chrono::nanoseconds elapsed) {
        const double secs = std::chrono::duration<double>(elapsed).count();
        std::cout << "\n[ PERF ] " << label << "\n        threads=" << threads
                  << " ops=" << ops << std::fixed << std::setprecision(0)
                  << " ops_per_s=" << (secs > 0 ? ops / secs : 0.0) << "\n";
    }

    class EchoClient : public genai_pool::GenerativeClient {
       public:
        genai_pool::Result<std::string> generate(
            const std::string& model, const genai_pool::Payload&) override {
            return genai_pool::Result<std::string>::ok(model);
        }
    };

    std::vector<std::string> perf_keys(std::size_t n) {
        std::vector<std::string> out;
        for (std::size_t i = 0; i < n; ++i) {
            out.push_back("perf-key-" + std::to_string(i));
        }
        return out;
    }

    // Loopback endpoint that answers every request with one canned candidate.
    class LoopbackGemini {
       public:
        LoopbackGemini()
            : m_acceptor(m_ioc,
                         tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
            accept();
            m_thread = std::thread([this] { m_ioc.run(); });
        }

        ~LoopbackGemini() {
            m_ioc.stop();
            if (m_thread.joinable()) m_thread.join();
        }

        std::string base_url() const {
            return "http://127.0.0.1:" +
                   std::to_string(m_acceptor.local_endpoint().port());
        }

       private:
        void accept() {
            m_acceptor.async_accept(
                [this](boost::system::error_code ec, tcp::socket sock) {
                    if (ec) return;
                    std::thread(&LoopbackGemini::serve, std::move(sock))
                        .detach();
                    accept();
                });
        }

        static void serve(tcp::socket sock) {
            beast::tcp_stream stream(std::move(sock));
            beast::flat_buffer buffer;
            boost::system::error_code ec;

            while (!ec) {
                http::request<http::string_body> req;
                http::read(stream, buffer, req, ec);
                if (ec) break;

                http::response<http::string_body> res{http::status::ok,
                                                      req.version()};
                res.keep_alive(req.keep_alive());
                res.set(http::field::content_type, "application/json");
                res.body() =
                    R"({"candidates":[{"content":{"parts":[{"text":"ok"}]}}]})";
                res.prepare_payload();
                http::write(stream, res, ec);
                if (!res.keep_alive()) break;
            }
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        net::io_context m_ioc;
        tcp::acceptor m_acceptor;
        std::thread m_thread;
    };

}  // namespace

TEST(CredentialPoolPerf, SelectSingleThread) {
    genai_pool::CredentialPool pool(perf_keys(8));
    Samples samples;

    for (int i = 0; i < 100000; ++i) {
        samples.time([&] { ASSERT_TRUE(pool.select().has_value()); });
    }
    samples.report("CredentialPool::select, one thread, 8 keys");
}

TEST(CredentialPoolPerf, SelectAndMarkUnderContention) {
    constexpr int per_thread = 50000;
    const int threads =
        std::max(2, static_cast<int>(std::thread::hardware_concurrency()));
    genai_pool::CredentialPool pool(perf_keys(16));
    std::atomic<std::uint64_t> ops{0};

    const auto elapsed = run_workers(threads, [&](int) {
        for (int i = 0; i < per_thread; ++i) {
            auto r = pool.select();
            if (r.has_value()) pool.mark_success(r.value().index);
            ops.fetch_add(1, std::memory_order_relaxed);
        }
    });

    EXPECT_EQ(ops.load(), static_cast<std::uint64_t>(threads) * per_thread);
    report_throughput("select + mark_success, 16 keys", threads, ops.load(),
                      elapsed);
}

TEST(CredentialPoolPerf, ExecutorInMemoryClients) {
    constexpr int per_thread = 20000;
    constexpr int threads = 8;
    genai_pool::CredentialPool pool(perf_keys(4));
    genai_pool::ClientCache clients([](const genai_pool::SelectedCredential&) {
        return std::unique_ptr<genai_pool::GenerativeClient>(
            std::make_unique<EchoClient>());
    });
    genai_pool::CallExecutor executor(pool, clients,
                                      genai_pool::ModelTable::defaults());
    std::atomic<std::uint64_t> ok{0};

    const auto elapsed = run_workers(threads, [&](int) {
        const auto payload = genai_pool::Payload::text("perf");
        for (int i = 0; i < per_thread; ++i) {
            if (executor.call_vision(payload).has_value()) {
                ok.fetch_add(1, std::memory_order_relaxed);
            }
        }
    });

    EXPECT_EQ(ok.load(), static_cast<std::uint64_t>(threads) * per_thread);
    report_throughput("CallExecutor::execute, in-memory clients", threads,
                      ok.load(), elapsed);
}

TEST(GatewayWirePerf, KeepAliveRotationAndConcurrentCallers) {
    LoopbackGemini server;

    genai_pool::GatewayConfiguration cfg;
    cfg.credentials = perf_keys(4);
    cfg.service.base_url = server.base_url();
    cfg.service.user_agent = "genai_pool-perf";
    cfg.retry.retry_delay = std::chrono::milliseconds(0);
    genai_pool::Gateway gateway(cfg);
    const auto payload = genai_pool::Payload::text("perf");

    // Warm-up opens one connection per key.
    for (int i = 0; i < 4; ++i) {
        auto r = gateway.call_orchestrator(payload);
        ASSERT_TRUE(r.has_value()) << r.error().message;
    }

    Samples samples;
    for (int i = 0; i < 500; ++i) {
        samples.time([&] {
            auto r = gateway.call_orchestrator(payload);
            ASSERT_TRUE(r.has_value());
            EXPECT_EQ(r.value(), "ok");
        });
    }
    samples.report("Gateway over loopback, 4 warm keys");

    constexpr int threads = 8;
    constexpr int per_thread = 100;
    std::atomic<std::uint64_t> ok{0};
    const auto elapsed = run_workers(threads, [&](int) {
        for (int i = 0; i < per_thread; ++i) {
            if (gateway.call_vision(payload).has_value()) {
                ok.fetch_add(1, std::memory_order_relaxed);
            }
        }
    });

    EXPECT_EQ(ok.load(), static_cast<std::uint64_t>(threads) * per_thread);
    report_throughput("Gateway over loopback, 8 callers on 4 keys", threads,
                      ok.load(), elapsed);
}

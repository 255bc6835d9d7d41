#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <chrono>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fake_transport.hpp"
#include "local_http_server.hpp"
#include "muxpool/async_client.hpp"
#include "muxpool/connection/connection_pool.hpp"
#include "test_support.hpp"

using namespace muxpool;
using namespace muxpool_test;

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_us =
        std::chrono::duration<double, std::micro>(total).count() / iters;
    const double min_us =
        std::chrono::duration<double, std::micro>(min).count();
    const double max_us =
        std::chrono::duration<double, std::micro>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << " total_ms=" << std::fixed
              << std::setprecision(2) << total_ms << " avg_us=" << std::fixed
              << std::setprecision(2) << avg_us << " min_us=" << std::fixed
              << std::setprecision(2) << min_us << " max_us=" << std::fixed
              << std::setprecision(2) << max_us << "\n";
}

static void print_rps(const char* label, int seconds,
                      std::uint64_t total_reqs) {
    const double avg = seconds > 0 ? (double)total_reqs / (double)seconds : 0.0;

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        duration_s=" << seconds
              << " total_reqs=" << total_reqs << " avg_rps=" << std::fixed
              << std::setprecision(2) << avg << "\n";
}

class PoolPerf : public ::testing::Test {
   protected:
    static void SetUpTestSuite() {
        cfg_.user_agent = "muxpool-perf";
        cfg_.max_concurrency = 100;
        cfg_.event_loop.options =
            EventLoopGroupOptions{std::thread::hardware_concurrency(),
                                  "muxpool-perf"};
        cfg_.logging.level = "warn";
        cfg_.shutdown.quiet_period = std::chrono::milliseconds(100);
        cfg_.shutdown.timeout = std::chrono::seconds(2);
        cfg_.shutdown.outer_timeout = std::chrono::seconds(3);
    }

    static inline ClientConfiguration cfg_{};
};

TEST_F(PoolPerf, TryAcquireReleaseUncontended) {
    constexpr int iters = 100000;

    IoThreadRunner runner;
    runner.start();

    ConnectionPool::Settings s;
    s.max_concurrency = 1;
    s.use_idle_connection_reaper = false;
    auto pool = ConnectionPool::create(
        runner.get_executor(), OriginKey::make("http", "perf.local"),
        ProtocolLimits{}, s, std::make_shared<FakeTransport>());

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    const auto start = clock::now();
    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        auto lease = pool->try_acquire();
        ASSERT_TRUE(lease.has_value());
        lease->release();
        const auto dt = std::chrono::duration_cast<std::chrono::nanoseconds>(
            clock::now() - t0);
        min = std::min(min, dt);
        max = std::max(max, dt);
    }
    const auto total = std::chrono::duration_cast<std::chrono::nanoseconds>(
        clock::now() - start);

    EXPECT_EQ(pool->metrics().connection_created.load(), 1u);
    pool->close_now();
    print_result("try_acquire + release (one connection)", iters, total, min,
                 max);
}

TEST_F(PoolPerf, AcquireUnderContentionHttp2) {
    constexpr int workers = 64;
    constexpr int per_worker = 2000;

    IoThreadRunner runner(4);
    runner.start();

    ConnectionPool::Settings s;
    s.max_concurrency = 16;
    s.max_pending_acquires = workers;
    s.use_idle_connection_reaper = false;
    ProtocolLimits limits;
    limits.protocol = Protocol::Http2;
    limits.max_concurrent_streams = 8;
    auto pool = ConnectionPool::create(
        runner.get_executor(), OriginKey::make("https", "perf.local"), limits,
        s, std::make_shared<FakeTransport>());

    std::atomic<int> failures{0};
    std::vector<std::future<void>> done;

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    for (int w = 0; w < workers; ++w) {
        done.push_back(spawn_future(
            runner.get_executor(),
            [](std::shared_ptr<ConnectionPool> pool,
               std::atomic<int>& failures) -> net::awaitable<void> {
                for (int i = 0; i < per_worker; ++i) {
                    auto lease = co_await pool->acquire();
                    if (lease.has_error()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    lease.value().release();
                }
            }(pool, failures)));
    }
    for (auto& f : done) f.get();
    const auto total = std::chrono::duration_cast<std::chrono::nanoseconds>(
        clock::now() - start);

    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(pool->metrics().connection_created.load(), 2u);
    pool->close_now();
    print_result("acquire + release, 64 coroutines, HTTP/2 8 streams",
                 workers * per_worker, total, std::chrono::nanoseconds{0},
                 std::chrono::nanoseconds{0});
}

TEST_F(PoolPerf, WarmSequentialGetsLocalServer) {
    constexpr int iters = 200;

    LocalHttpServer server;
    AsyncHttpClient client(cfg_);

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};
    std::vector<std::chrono::nanoseconds> samples;

    auto fut = spawn_future(
        client.get_executor(),
        [](AsyncHttpClient& client, std::string url,
           std::vector<std::chrono::nanoseconds>& samples)
            -> net::awaitable<bool> {
            // Warm-up
            {
                auto r = co_await client.get(url);
                if (!r.has_value() || r.value().status_code != 200) {
                    co_return false;
                }
            }

            for (int i = 0; i < iters; ++i) {
                const auto t0 = clock::now();
                auto r = co_await client.get(url);
                const auto t1 = clock::now();

                if (!r.has_value() || r.value().status_code != 200) {
                    co_return false;
                }
                samples.push_back(
                    std::chrono::duration_cast<std::chrono::nanoseconds>(t1 -
                                                                         t0));
            }
            co_return true;
        }(client, server.url("/health"), samples));

    ASSERT_TRUE(fut.get());
    for (auto dt : samples) {
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }
    EXPECT_EQ(server.connections_accepted.load(), 1);
    print_result("Warm (async client -> local server) SEQUENTIAL", iters,
                 total, min, max);
}

TEST_F(PoolPerf, MaxRps5SecondsConcurrency10) {
    static constexpr int seconds = 5;
    constexpr int concurrency = 10;

    LocalHttpServer server;
    AsyncHttpClient client(cfg_);
    const auto url = server.url("/health");

    std::atomic<std::uint64_t> total_reqs{0};
    std::atomic<bool> run{true};

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();

    std::vector<std::future<void>> done;
    for (int i = 0; i < concurrency; ++i) {
        done.push_back(spawn_future(
            client.get_executor(),
            [](AsyncHttpClient& client, std::string url,
               std::atomic<bool>& run, std::atomic<std::uint64_t>& total_reqs,
               clock::time_point start) -> net::awaitable<void> {
                while (run.load()) {
                    auto r = co_await client.get(url);
                    if (r.has_value() && clock::now() - start <
                                             std::chrono::seconds(seconds)) {
                        total_reqs.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            }(client, url, run, total_reqs, start)));
    }

    std::this_thread::sleep_for(std::chrono::seconds(seconds));
    run = false;
    for (auto& f : done) f.get();

    EXPECT_LE(server.connections_accepted.load(), concurrency);
    print_rps("Max RPS over 5s (async client, 10 concurrent coroutines)",
              seconds, total_reqs.load());
}

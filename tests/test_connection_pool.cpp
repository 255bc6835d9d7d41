#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "fake_transport.hpp"
#include "muxpool/connection/connection_pool.hpp"
#include "test_support.hpp"

using namespace muxpool;
using namespace muxpool_test;
using namespace std::chrono_literals;

namespace {

    ConnectionPool::Settings test_settings(std::size_t max_concurrency = 2) {
        ConnectionPool::Settings s;
        s.max_concurrency = max_concurrency;
        s.max_pending_acquires = 100;
        s.connection_max_idle_time = 30s;
        s.use_idle_connection_reaper = false;
        s.close_grace_period = 100ms;
        return s;
    }

    ProtocolLimits h1() { return ProtocolLimits{}; }

    ProtocolLimits h2(std::uint64_t max_streams) {
        ProtocolLimits l;
        l.protocol = Protocol::Http2;
        l.max_concurrent_streams = max_streams;
        return l;
    }

    OriginKey test_origin() { return OriginKey::make("http", "example.com"); }

    std::shared_ptr<ConnectionPool> make_pool(
        IoThreadRunner& runner, std::shared_ptr<FakeTransport> transport,
        ConnectionPool::Settings settings = test_settings(),
        ProtocolLimits limits = h1()) {
        return ConnectionPool::create(runner.get_executor(), test_origin(),
                                      limits, settings, std::move(transport));
    }

    using LeaseResult = Result<ConnectionPool::Lease>;

}  // namespace

TEST(ConnectionPoolTest, TryAcquireCreatesAndReusesIdle) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport);

    auto lease1 = pool->try_acquire();
    ASSERT_TRUE(lease1.has_value());
    const auto conn1 = lease1->connection_id();
    ASSERT_NE(lease1->channel(), nullptr);
    lease1->release();
    EXPECT_FALSE(*lease1);

    auto lease2 = pool->try_acquire();
    ASSERT_TRUE(lease2.has_value());
    EXPECT_EQ(lease2->connection_id(), conn1);

    EXPECT_EQ(transport->opened.load(), 1);
    EXPECT_EQ(pool->metrics().connection_created.load(), 1u);
    EXPECT_EQ(pool->metrics().connection_reused.load(), 1u);
}

TEST(ConnectionPoolTest, TryAcquireRespectsMaxConcurrency) {
    IoThreadRunner runner;
    runner.start();
    auto pool = make_pool(runner, std::make_shared<FakeTransport>());

    auto l1 = pool->try_acquire();
    auto l2 = pool->try_acquire();
    auto l3 = pool->try_acquire();
    EXPECT_TRUE(l1.has_value());
    EXPECT_TRUE(l2.has_value());
    EXPECT_FALSE(l3.has_value());
    EXPECT_NE(l1->connection_id(), l2->connection_id());

    auto st = pool->stats();
    EXPECT_EQ(st.active_leases, 2u);
    EXPECT_EQ(st.connections, 2u);
    EXPECT_EQ(st.idle_connections, 0u);
}

TEST(ConnectionPoolTest, DestroyedLeaseReturnsItsSlot) {
    IoThreadRunner runner;
    runner.start();
    auto pool = make_pool(runner, std::make_shared<FakeTransport>());

    {
        auto lease = pool->try_acquire();
        ASSERT_TRUE(lease.has_value());
        ConnectionPool::Lease moved = std::move(*lease);
        EXPECT_FALSE(*lease);
        EXPECT_TRUE(moved);
        EXPECT_EQ(pool->stats().active_leases, 1u);
    }

    EXPECT_EQ(pool->stats().active_leases, 0u);
    EXPECT_EQ(pool->metrics().lease_released.load(), 1u);
}

TEST(ConnectionPoolTest, ThirdAcquireWaitsForARelease) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport);
    auto ex = runner.get_executor();

    auto r1 = await_or_abort(ex, pool->acquire(), 2000ms);
    auto r2 = await_or_abort(ex, pool->acquire(), 2000ms);
    ASSERT_TRUE(r1.has_value()) << r1.error().message;
    ASSERT_TRUE(r2.has_value()) << r2.error().message;
    const auto first_conn = r1.value().connection_id();

    auto third = spawn_future(ex, pool->acquire(5s));
    ASSERT_TRUE(wait_until([&] { return pool->stats().pending_acquires == 1; }));
    EXPECT_FALSE(is_ready(third));
    EXPECT_EQ(pool->stats().active_leases, 2u);

    r1.value().release();

    ASSERT_EQ(third.wait_for(2s), std::future_status::ready);
    auto r3 = third.get();
    ASSERT_TRUE(r3.has_value()) << r3.error().message;
    EXPECT_EQ(r3.value().connection_id(), first_conn);
    EXPECT_EQ(pool->stats().active_leases, 2u);
    EXPECT_EQ(pool->stats().pending_acquires, 0u);
    EXPECT_EQ(transport->opened.load(), 2);
    EXPECT_EQ(pool->metrics().acquire_queued.load(), 1u);
}

TEST(ConnectionPoolTest, FullQueueFailsFast) {
    IoThreadRunner runner;
    runner.start();
    auto settings = test_settings(1);
    settings.max_pending_acquires = 0;
    auto pool = make_pool(runner, std::make_shared<FakeTransport>(), settings);

    auto hold = pool->try_acquire();
    ASSERT_TRUE(hold.has_value());

    const auto start = std::chrono::steady_clock::now();
    auto r = await_or_abort(runner.get_executor(), pool->acquire(5s), 2000ms);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::CapacityExceeded);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(pool->metrics().acquire_capacity_exceeded.load(), 1u);
    EXPECT_EQ(pool->stats().pending_acquires, 0u);
}

TEST(ConnectionPoolTest, WaitersAreServedInArrivalOrder) {
    IoThreadRunner runner;
    runner.start();
    auto pool = make_pool(runner, std::make_shared<FakeTransport>(),
                          test_settings(1));
    auto ex = runner.get_executor();

    auto hold = pool->try_acquire();
    ASSERT_TRUE(hold.has_value());

    auto first = spawn_future(ex, pool->acquire(5s));
    ASSERT_TRUE(wait_until([&] { return pool->stats().pending_acquires == 1; }));
    auto second = spawn_future(ex, pool->acquire(5s));
    ASSERT_TRUE(wait_until([&] { return pool->stats().pending_acquires == 2; }));

    // A free slot never goes to try_acquire while others wait.
    EXPECT_FALSE(pool->try_acquire().has_value());

    hold->release();
    ASSERT_EQ(first.wait_for(2s), std::future_status::ready);
    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(is_ready(second));

    auto a = first.get();
    ASSERT_TRUE(a.has_value());
    a.value().release();

    ASSERT_EQ(second.wait_for(2s), std::future_status::ready);
    auto b = second.get();
    ASSERT_TRUE(b.has_value());
}

TEST(ConnectionPoolTest, QueuedAcquireTimesOut) {
    IoThreadRunner runner;
    runner.start();
    auto pool = make_pool(runner, std::make_shared<FakeTransport>(),
                          test_settings(1));

    auto hold = pool->try_acquire();
    ASSERT_TRUE(hold.has_value());

    auto r = await_or_abort(runner.get_executor(), pool->acquire(50ms), 2000ms);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::AcquisitionTimeout);
    EXPECT_NE(r.error().message.find("50 ms"), std::string::npos);
    EXPECT_EQ(pool->stats().pending_acquires, 0u);
    EXPECT_EQ(pool->metrics().acquire_timeout.load(), 1u);

    // The slot is still usable by the next caller.
    hold->release();
    auto again = await_or_abort(runner.get_executor(), pool->acquire(50ms),
                                2000ms);
    EXPECT_TRUE(again.has_value());
}

TEST(ConnectionPoolTest, CancellingAQueuedAcquire) {
    IoThreadRunner runner;
    runner.start();
    auto pool = make_pool(runner, std::make_shared<FakeTransport>(),
                          test_settings(1));

    auto hold = pool->try_acquire();
    ASSERT_TRUE(hold.has_value());

    CancellationSource src;
    auto fut = spawn_future(runner.get_executor(),
                            pool->acquire(5s, src.token()));
    ASSERT_TRUE(wait_until([&] { return pool->stats().pending_acquires == 1; }));

    EXPECT_TRUE(src.cancel());
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto r = fut.get();
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Cancelled);
    EXPECT_EQ(pool->stats().pending_acquires, 0u);
    EXPECT_EQ(pool->stats().active_leases, 1u);
    EXPECT_EQ(pool->metrics().acquire_cancelled.load(), 1u);
}

TEST(ConnectionPoolTest, AlreadyCancelledTokenNeverOpensAConnection) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport);

    CancellationSource src;
    src.cancel();
    auto r = await_or_abort(runner.get_executor(),
                            pool->acquire(5s, src.token()), 2000ms);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Cancelled);
    EXPECT_EQ(transport->opened.load(), 0);
}

TEST(ConnectionPoolTest, DoubleReleaseIsRejected) {
    IoThreadRunner runner;
    runner.start();
    auto pool = make_pool(runner, std::make_shared<FakeTransport>());

    auto lease = pool->try_acquire();
    ASSERT_TRUE(lease.has_value());

    pool->release(*lease);
    EXPECT_EQ(pool->stats().active_leases, 0u);

    EXPECT_THROW(pool->release(*lease), std::logic_error);
    EXPECT_THROW(lease->release(), std::logic_error);
    EXPECT_EQ(pool->metrics().release_invalid.load(), 1u);
    EXPECT_EQ(pool->metrics().lease_released.load(), 1u);
    EXPECT_EQ(pool->stats().active_leases, 0u);
}

TEST(ConnectionPoolTest, LeaseFromAnotherPoolIsRejected) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool_a = make_pool(runner, transport);
    auto pool_b = make_pool(runner, transport);

    auto lease = pool_a->try_acquire();
    ASSERT_TRUE(lease.has_value());

    EXPECT_THROW(pool_b->release(*lease), std::logic_error);
    EXPECT_EQ(pool_b->metrics().release_invalid.load(), 1u);
    EXPECT_EQ(pool_a->stats().active_leases, 1u);

    EXPECT_NO_THROW(lease->release());
    EXPECT_EQ(pool_a->stats().active_leases, 0u);
}

TEST(ConnectionPoolTest, IdleSweepSkipsLeasedConnections) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto settings = test_settings(2);
    settings.connection_max_idle_time = 100ms;
    auto pool = make_pool(runner, transport, settings);

    auto busy = pool->try_acquire();
    auto idle = pool->try_acquire();
    ASSERT_TRUE(busy.has_value());
    ASSERT_TRUE(idle.has_value());
    idle->release();

    EXPECT_EQ(pool->reap_idle(), 0u);

    auto later = std::chrono::steady_clock::now() + 1s;
    EXPECT_EQ(pool->reap_idle(later), 1u);
    EXPECT_EQ(pool->stats().connections, 1u);
    EXPECT_EQ(transport->closed.load(), 1);
    EXPECT_TRUE(busy->channel()->is_open());
    EXPECT_EQ(pool->metrics().connection_reaped_idle.load(), 1u);

    busy->release();
    later = std::chrono::steady_clock::now() + 1s;
    EXPECT_EQ(pool->reap_idle(later), 1u);
    EXPECT_EQ(pool->stats().connections, 0u);
}

TEST(ConnectionPoolTest, ExpiredConnectionClosedWhenReleased) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto settings = test_settings(1);
    settings.connection_time_to_live = 50ms;
    auto pool = make_pool(runner, transport, settings);

    auto lease = pool->try_acquire();
    ASSERT_TRUE(lease.has_value());
    std::this_thread::sleep_for(80ms);

    // Never torn down while leased.
    EXPECT_EQ(pool->reap_idle(), 0u);
    EXPECT_EQ(pool->stats().connections, 1u);

    lease->release();
    EXPECT_EQ(pool->stats().connections, 0u);
    EXPECT_EQ(transport->closed.load(), 1);
    EXPECT_EQ(pool->metrics().connection_expired_ttl.load(), 1u);

    auto next = pool->try_acquire();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(transport->opened.load(), 2);
}

TEST(ConnectionPoolTest, BackgroundReaperClosesIdleConnections) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto settings = test_settings(1);
    settings.use_idle_connection_reaper = true;
    settings.idle_reaper_interval = 20ms;
    settings.connection_max_idle_time = 30ms;
    auto pool = make_pool(runner, transport, settings);

    auto lease = pool->try_acquire();
    ASSERT_TRUE(lease.has_value());
    lease->release();
    EXPECT_EQ(pool->stats().connections, 1u);

    EXPECT_TRUE(wait_until([&] { return pool->stats().connections == 0; }));
    EXPECT_GE(pool->metrics().connection_reaped_idle.load(), 1u);
    EXPECT_EQ(transport->closed.load(), 1);
}

TEST(ConnectionPoolTest, DegradedConnectionIsNotReused) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport, test_settings(1));

    auto lease = pool->try_acquire();
    ASSERT_TRUE(lease.has_value());
    const auto conn = lease->connection_id();
    pool->mark_degraded(*lease);
    lease->release();

    EXPECT_EQ(pool->stats().connections, 0u);
    EXPECT_EQ(pool->metrics().connection_dropped_unhealthy.load(), 1u);

    auto next = pool->try_acquire();
    ASSERT_TRUE(next.has_value());
    EXPECT_NE(next->connection_id(), conn);
    EXPECT_EQ(transport->opened.load(), 2);
}

TEST(ConnectionPoolTest, ConnectionClosedByPeerIsDropped) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport, test_settings(1));

    auto lease = pool->try_acquire();
    ASSERT_TRUE(lease.has_value());
    std::static_pointer_cast<FakeChannel>(lease->channel())->open = false;
    lease->release();

    EXPECT_EQ(pool->stats().connections, 0u);
    auto next = pool->try_acquire();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(transport->opened.load(), 2);
}

TEST(ConnectionPoolTest, ChannelOpenFailureIsReported) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    transport->fail_open = true;
    auto pool = make_pool(runner, transport);

    auto r = await_or_abort(runner.get_executor(), pool->acquire(1s), 2000ms);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
    EXPECT_EQ(pool->stats().active_leases, 0u);
    EXPECT_EQ(pool->stats().connections, 0u);
    EXPECT_FALSE(pool->try_acquire().has_value());

    transport->fail_open = false;
    EXPECT_TRUE(pool->try_acquire().has_value());
}

TEST(ConnectionPoolTest, Http2MultiplexesStreamsOnOneConnection) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto settings = test_settings(100);
    settings.max_pending_acquires = 1000;
    auto pool = make_pool(runner, transport, settings, h2(100));
    auto ex = runner.get_executor();

    std::vector<std::future<LeaseResult>> futures;
    futures.reserve(150);
    for (int i = 0; i < 150; ++i) {
        futures.push_back(spawn_future(ex, pool->acquire(10s)));
    }

    auto count_ready = [&] {
        std::size_t n = 0;
        for (auto& f : futures) {
            if (is_ready(f)) ++n;
        }
        return n;
    };

    ASSERT_TRUE(wait_until([&] {
        auto st = pool->stats();
        return st.active_leases == 100 && st.pending_acquires == 50 &&
               count_ready() == 100;
    }));
    EXPECT_EQ(pool->stats().connections, 1u);
    EXPECT_EQ(transport->opened.load(), 1);

    std::vector<ConnectionPool::Lease> held;
    std::vector<std::future<LeaseResult>> waiting;
    for (auto& f : futures) {
        if (is_ready(f)) {
            auto r = f.get();
            ASSERT_TRUE(r.has_value()) << r.error().message;
            held.push_back(std::move(r.value()));
        } else {
            waiting.push_back(std::move(f));
        }
    }
    ASSERT_EQ(held.size(), 100u);
    ASSERT_EQ(waiting.size(), 50u);

    held.clear();

    for (auto& f : waiting) {
        ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
        auto r = f.get();
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value().protocol(), Protocol::Http2);
        held.push_back(std::move(r.value()));
    }
    EXPECT_EQ(pool->stats().connections, 1u);
    EXPECT_EQ(transport->opened.load(), 1);
    EXPECT_EQ(pool->stats().active_leases, 50u);
}

TEST(ConnectionPoolTest, Http2OpensAnotherConnectionWhenStreamsRunOut) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport, test_settings(5), h2(2));

    std::vector<ConnectionPool::Lease> held;
    for (int i = 0; i < 5; ++i) {
        auto l = pool->try_acquire();
        ASSERT_TRUE(l.has_value());
        held.push_back(std::move(*l));
    }
    EXPECT_FALSE(pool->try_acquire().has_value());
    EXPECT_EQ(pool->stats().connections, 3u);
    EXPECT_EQ(held[0].connection_id(), held[1].connection_id());
    EXPECT_EQ(transport->opened.load(), 3);
}

TEST(ConnectionPoolTest, ConcurrentChurnNeverExceedsMaxConcurrency) {
    IoThreadRunner runner(4);
    runner.start();
    auto settings = test_settings(4);
    settings.max_pending_acquires = 1000;
    auto pool = make_pool(runner, std::make_shared<FakeTransport>(), settings);

    std::atomic<int> held{0};
    std::atomic<int> peak{0};

    auto churn = [pool, &held, &peak]() -> net::awaitable<int> {
        auto ex = co_await net::this_coro::executor;
        int served = 0;
        for (int i = 0; i < 10; ++i) {
            auto r = co_await pool->acquire(5s);
            if (r.has_error()) continue;
            const int now = held.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            net::steady_timer t(ex);
            t.expires_after(1ms);
            co_await t.async_wait(net::use_awaitable);
            held.fetch_sub(1);
            r.value().release();
            ++served;
        }
        co_return served;
    };

    std::vector<std::future<int>> workers;
    for (int i = 0; i < 32; ++i) {
        workers.push_back(spawn_future(runner.get_executor(), churn()));
    }

    int total = 0;
    for (auto& w : workers) {
        ASSERT_EQ(w.wait_for(10s), std::future_status::ready);
        total += w.get();
    }
    EXPECT_EQ(total, 320);
    EXPECT_LE(peak.load(), 4);
    EXPECT_EQ(pool->stats().active_leases, 0u);
    EXPECT_LE(pool->stats().connections, 4u);
}

TEST(ConnectionPoolTest, CloseForceCancelsLeasesAfterGrace) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport, test_settings(10));
    auto ex = runner.get_executor();

    std::vector<ConnectionPool::Lease> held;
    for (int i = 0; i < 5; ++i) {
        auto l = pool->try_acquire();
        ASSERT_TRUE(l.has_value());
        held.push_back(std::move(*l));
    }

    const auto start = std::chrono::steady_clock::now();
    auto closing = spawn_future(ex, pool->close(100ms));
    ASSERT_TRUE(
        wait_until([&] { return pool->state() != PoolState::Active; }));

    auto late = await_or_abort(ex, pool->acquire(1s), 2000ms);
    ASSERT_TRUE(late.has_error());
    EXPECT_EQ(late.error().code, Error::Code::PoolClosed);

    ASSERT_EQ(closing.wait_for(2s), std::future_status::ready);
    closing.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    EXPECT_EQ(pool->state(), PoolState::Closed);
    EXPECT_EQ(pool->metrics().lease_force_cancelled.load(), 5u);
    EXPECT_EQ(transport->aborted.load(), 5);
    EXPECT_EQ(pool->stats().active_leases, 0u);

    // Revoked leases are inert.
    for (auto& l : held) EXPECT_NO_THROW(l.release());
    EXPECT_EQ(pool->metrics().release_invalid.load(), 0u);
}

TEST(ConnectionPoolTest, CloseWaitsForLeasesReleasedWithinGrace) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport);

    auto l1 = pool->try_acquire();
    auto l2 = pool->try_acquire();
    ASSERT_TRUE(l1.has_value());
    ASSERT_TRUE(l2.has_value());

    const auto start = std::chrono::steady_clock::now();
    auto closing = spawn_future(runner.get_executor(), pool->close(5000ms));
    ASSERT_TRUE(
        wait_until([&] { return pool->state() == PoolState::Draining; }));
    EXPECT_FALSE(is_ready(closing));

    l1->release();
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(is_ready(closing));
    l2->release();

    ASSERT_EQ(closing.wait_for(2s), std::future_status::ready);
    closing.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(pool->state(), PoolState::Closed);
    EXPECT_EQ(pool->metrics().lease_force_cancelled.load(), 0u);
    EXPECT_EQ(transport->aborted.load(), 0);
    EXPECT_EQ(transport->closed.load(), 2);
}

TEST(ConnectionPoolTest, CloseFailsQueuedAcquires) {
    IoThreadRunner runner;
    runner.start();
    auto pool = make_pool(runner, std::make_shared<FakeTransport>(),
                          test_settings(1));
    auto ex = runner.get_executor();

    auto hold = pool->try_acquire();
    ASSERT_TRUE(hold.has_value());
    auto waiting = spawn_future(ex, pool->acquire(5s));
    ASSERT_TRUE(wait_until([&] { return pool->stats().pending_acquires == 1; }));

    auto closing = spawn_future(ex, pool->close(50ms));

    ASSERT_EQ(waiting.wait_for(2s), std::future_status::ready);
    auto r = waiting.get();
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::PoolClosed);

    ASSERT_EQ(closing.wait_for(2s), std::future_status::ready);
    closing.get();
    EXPECT_NO_THROW(hold->release());
}

TEST(ConnectionPoolTest, CloseIsIdempotent) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport);
    auto ex = runner.get_executor();

    auto lease = pool->try_acquire();
    ASSERT_TRUE(lease.has_value());
    lease->release();

    await_or_abort(ex, pool->close(), 2000ms);
    await_or_abort(ex, pool->close(), 2000ms);
    pool->close_now();

    EXPECT_EQ(pool->state(), PoolState::Closed);
    EXPECT_EQ(transport->closed.load(), 1);
    EXPECT_EQ(pool->stats().connections, 0u);
    EXPECT_FALSE(pool->try_acquire().has_value());
}

TEST(ConnectionPoolTest, CloseNowAbortsBusyConnections) {
    IoThreadRunner runner;
    runner.start();
    auto transport = std::make_shared<FakeTransport>();
    auto pool = make_pool(runner, transport);

    auto busy = pool->try_acquire();
    auto idle = pool->try_acquire();
    ASSERT_TRUE(busy.has_value());
    ASSERT_TRUE(idle.has_value());
    idle->release();

    pool->close_now();
    EXPECT_EQ(pool->state(), PoolState::Closed);
    EXPECT_EQ(transport->aborted.load(), 1);
    EXPECT_EQ(transport->closed.load(), 1);
    EXPECT_EQ(pool->metrics().lease_force_cancelled.load(), 1u);
    EXPECT_NO_THROW(busy->release());
}

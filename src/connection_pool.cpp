#include "muxpool/connection/connection_pool.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cassert>
#include <exception>
#include <stdexcept>
#include <string>

#include "muxpool/logging.hpp"

namespace muxpool {

    using awaitable_void = boost::asio::awaitable<void>;

    namespace {
        constexpr auto relaxed = std::memory_order_relaxed;

        template <typename Duration>
        long long to_ms(Duration d) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(d)
                .count();
        }
    }  // namespace

    // -------------------------
    // Lease
    // -------------------------

    void ConnectionPool::Lease::release() {
        if (id_ == 0) {
            throw std::logic_error(
                "release of an empty or already released lease");
        }
        auto pool = pool_.lock();
        const auto id = id_;
        id_ = 0;
        connection_id_ = 0;
        channel_.reset();
        pool_.reset();

        if (pool && !pool->release_lease(id)) {
            throw std::logic_error("lease " + std::to_string(id) +
                                   " is not held by its pool");
        }
    }

    void ConnectionPool::Lease::reset() noexcept {
        if (id_ == 0) return;
        auto pool = pool_.lock();
        const auto id = id_;
        id_ = 0;
        connection_id_ = 0;
        channel_.reset();
        pool_.reset();
        if (pool) (void)pool->release_lease(id);
    }

    // -------------------------
    // construction / destruction
    // -------------------------

    ConnectionPool::ConnectionPool(executor_type ex, OriginKey origin,
                                   ProtocolLimits limits, Settings settings,
                                   std::shared_ptr<Transport> transport)
        : ex_(std::move(ex)),
          strand_(boost::asio::make_strand(ex_)),
          origin_(std::move(origin)),
          limits_(std::move(limits)),
          settings_(settings),
          transport_(std::move(transport)) {
        if (!transport_) {
            throw std::invalid_argument("connection pool needs a transport");
        }
        if (settings_.max_concurrency == 0) settings_.max_concurrency = 1;
    }

    std::shared_ptr<ConnectionPool> ConnectionPool::create(
        executor_type ex, OriginKey origin, ProtocolLimits limits,
        Settings settings, std::shared_ptr<Transport> transport) {
        std::shared_ptr<ConnectionPool> pool(
            new ConnectionPool(std::move(ex), std::move(origin),
                               std::move(limits), settings,
                               std::move(transport)));

        if (pool->settings_.use_idle_connection_reaper &&
            pool->settings_.idle_reaper_interval.count() > 0) {
            pool->start_reaper();
        }

        logger()->debug(
            "created {} pool for {} (max concurrency {}, max streams {})",
            to_string(pool->limits_.protocol), pool->origin_.to_string(),
            pool->settings_.max_concurrency,
            pool->limits_.max_concurrent_streams);
        return pool;
    }

    ConnectionPool::~ConnectionPool() {
        // Waiter coroutines hold strong references, so none is alive here.
        try {
            for (auto& [id, conn] : connections_) {
                (void)id;
                if (conn->channel()) transport_->close(*conn->channel());
            }
            connections_.clear();
            if (reaper_timer_) {
                boost::asio::post(strand_,
                                  [t = reaper_timer_] { t->cancel(); });
            }
        } catch (const std::exception& e) {
            logger()->error("error destroying pool for {}: {}",
                            origin_.to_string(), e.what());
        }
    }

    // -------------------------
    // acquire
    // -------------------------

    boost::asio::awaitable<Result<ConnectionPool::Lease>>
    ConnectionPool::acquire(clock_type::duration timeout,
                            CancellationToken cancel) {
        auto self = shared_from_this();

        // Waiter bookkeeping and timers live on the strand; a wakeup posted
        // there can't overtake the wait it is meant to end.
        auto on_strand = [self, timeout,
                          cancel]() -> boost::asio::awaitable<AcquireOutcome> {
            co_return co_await acquire_on_strand(self, timeout, cancel);
        };
        AcquireOutcome out = co_await boost::asio::co_spawn(
            strand_, std::move(on_strand), boost::asio::use_awaitable);

        if (out.lease) co_return Result<Lease>::ok(std::move(*out.lease));
        if (out.error) co_return Result<Lease>::err(std::move(*out.error));
        co_return Result<Lease>::err(Error::Code::Unknown,
                                     "acquire finished without an outcome");
    }

    boost::asio::awaitable<ConnectionPool::AcquireOutcome>
    ConnectionPool::acquire_on_strand(std::shared_ptr<ConnectionPool> self,
                                      clock_type::duration timeout,
                                      CancellationToken cancel) {
        AcquireOutcome out;

        if (cancel.is_cancelled()) {
            self->metrics_.acquire_cancelled.fetch_add(1, relaxed);
            out.error = Error{Error::Code::Cancelled, "acquire cancelled"};
            co_return out;
        }

        auto waiter = std::make_shared<Waiter>();
        {
            Deferred d;
            {
                std::lock_guard<std::mutex> lk(self->mu_);
                const auto now = clock_type::now();

                if (self->state_ != PoolState::Active) {
                    self->metrics_.acquire_pool_closed.fetch_add(1, relaxed);
                    out.error = Error{Error::Code::PoolClosed,
                                      "connection pool for " +
                                          self->origin_.to_string() +
                                          " is closed"};
                } else {
                    self->last_activity_ = now;

                    // Never jump the queue.
                    if (self->waiters_.empty()) {
                        auto g = self->try_grant_locked_(now, d);
                        if (g.lease) {
                            out.lease = std::move(g.lease);
                        } else if (g.error) {
                            out.error = std::move(g.error);
                        }
                    }

                    if (!out.lease && !out.error) {
                        if (self->waiters_.size() >=
                            self->settings_.max_pending_acquires) {
                            self->metrics_.acquire_capacity_exceeded.fetch_add(
                                1, relaxed);
                            out.error = Error{
                                Error::Code::CapacityExceeded,
                                "too many pending acquires for " +
                                    self->origin_.to_string() + " (limit " +
                                    std::to_string(
                                        self->settings_.max_pending_acquires) +
                                    ")"};
                        } else {
                            waiter->timer =
                                std::make_shared<boost::asio::steady_timer>(
                                    self->strand_);
                            if (timeout >=
                                clock_type::time_point::max() - now) {
                                waiter->timer->expires_at(
                                    clock_type::time_point::max());
                            } else {
                                waiter->timer->expires_at(now + timeout);
                            }
                            self->waiters_.push_back(waiter);
                            self->metrics_.acquire_queued.fetch_add(1,
                                                                    relaxed);
                        }
                    }
                    self->check_invariants_locked_();
                }
            }
            self->run_deferred(d);
        }

        if (out.lease) {
            self->metrics_.acquire_success.fetch_add(1, relaxed);
            co_return out;
        }
        if (out.error) co_return out;

        std::weak_ptr<ConnectionPool> weak_pool = self;
        std::weak_ptr<Waiter> weak_waiter = waiter;
        auto registration = cancel.on_cancel([weak_pool, weak_waiter] {
            auto pool = weak_pool.lock();
            if (!pool) return;
            boost::asio::post(pool->strand_, [pool, weak_waiter] {
                if (auto w = weak_waiter.lock()) pool->cancel_waiter(w);
            });
        });

        boost::system::error_code ec;
        co_await waiter->timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        registration.reset();

        Deferred d;
        {
            std::lock_guard<std::mutex> lk(self->mu_);
            if (waiter->lease) {
                const bool revoked =
                    self->revoked_.count(waiter->lease->id()) != 0;
                if (revoked) {
                    self->metrics_.acquire_pool_closed.fetch_add(1, relaxed);
                    out.error = Error{Error::Code::PoolClosed,
                                      "connection pool for " +
                                          self->origin_.to_string() +
                                          " closed"};
                    d.to_drop.push_back(std::move(*waiter->lease));
                } else if (cancel.is_cancelled()) {
                    // Served and cancelled at once: give the slot back.
                    self->metrics_.acquire_cancelled.fetch_add(1, relaxed);
                    out.error =
                        Error{Error::Code::Cancelled, "acquire cancelled"};
                    d.to_drop.push_back(std::move(*waiter->lease));
                } else {
                    self->metrics_.acquire_success.fetch_add(1, relaxed);
                    out.lease = std::move(*waiter->lease);
                }
                waiter->lease.reset();
            } else if (waiter->error) {
                out.error = *waiter->error;
            } else {
                self->waiters_.remove(waiter);
                self->metrics_.acquire_timeout.fetch_add(1, relaxed);
                out.error = Error{
                    Error::Code::AcquisitionTimeout,
                    "Acquire operation took longer than the configured "
                    "maximum time (" +
                        std::to_string(to_ms(timeout)) + " ms) for " +
                        self->origin_.to_string()};
            }
        }
        self->run_deferred(d);
        co_return out;
    }

    std::optional<ConnectionPool::Lease> ConnectionPool::try_acquire() {
        Deferred d;
        std::optional<Lease> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (state_ != PoolState::Active || !waiters_.empty()) {
                return std::nullopt;
            }
            const auto now = clock_type::now();
            last_activity_ = now;
            auto g = try_grant_locked_(now, d);
            if (g.lease) {
                metrics_.acquire_success.fetch_add(1, relaxed);
                out = std::move(g.lease);
            } else if (g.error) {
                logger()->warn("try_acquire on {} failed: {}",
                               origin_.to_string(), g.error->message);
            }
        }
        run_deferred(d);
        return out;
    }

    void ConnectionPool::cancel_waiter(std::shared_ptr<Waiter> const& w) {
        Deferred d;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!w->pending()) return;
            w->error = Error{Error::Code::Cancelled, "acquire cancelled"};
            waiters_.remove(w);
            metrics_.acquire_cancelled.fetch_add(1, relaxed);
            serve_waiters_locked_(clock_type::now(), d);
        }
        if (w->timer) w->timer->cancel();
        run_deferred(d);
    }

    // -------------------------
    // release
    // -------------------------

    void ConnectionPool::release(Lease& lease) {
        auto owner = lease.pool_.lock();
        if (!lease || owner.get() != this) {
            metrics_.release_invalid.fetch_add(1, relaxed);
            logger()->error(
                "invalid lease release on pool {}: lease is empty, already "
                "released or owned by another pool",
                origin_.to_string());
            throw std::logic_error(
                "lease is empty, already released or from another pool");
        }
        lease.release();
    }

    bool ConnectionPool::release_lease(std::uint64_t lease_id) noexcept {
        bool known = true;
        try {
            Deferred d;
            {
                std::lock_guard<std::mutex> lk(mu_);
                auto it = leases_.find(lease_id);
                if (it == leases_.end()) {
                    // Force-cancelled by close(): late release is a no-op.
                    if (revoked_.erase(lease_id) != 0) return true;
                    metrics_.release_invalid.fetch_add(1, relaxed);
                    known = false;
                } else {
                    const auto now = clock_type::now();
                    const auto conn_id = it->second;
                    leases_.erase(it);
                    --active_leases_;
                    last_activity_ = now;
                    metrics_.lease_released.fetch_add(1, relaxed);

                    auto cit = connections_.find(conn_id);
                    if (cit != connections_.end()) {
                        auto& conn = *cit->second;
                        conn.release_one();
                        conn.touch(now);
                        if (conn.is_idle()) {
                            if (conn.ttl_expired(
                                    now, settings_.connection_time_to_live)) {
                                metrics_.connection_expired_ttl.fetch_add(
                                    1, relaxed);
                                remove_connection_locked_(cit, d);
                            } else if (!conn.is_open() ||
                                       conn.health() !=
                                           ConnectionHealth::Healthy) {
                                metrics_.connection_dropped_unhealthy.fetch_add(
                                    1, relaxed);
                                remove_connection_locked_(cit, d);
                            }
                        }
                    }

                    if (state_ == PoolState::Draining) {
                        if (active_leases_ == 0) d.drain = drain_timer_;
                    } else {
                        serve_waiters_locked_(now, d);
                    }
                    check_invariants_locked_();
                }
            }
            if (!known) {
                logger()->error(
                    "release of unknown or already released lease {} on {}",
                    lease_id, origin_.to_string());
            }
            run_deferred(d);
        } catch (const std::exception& e) {
            logger()->error("error releasing lease {} on {}: {}", lease_id,
                            origin_.to_string(), e.what());
        }
        return known;
    }

    void ConnectionPool::mark_degraded(const Lease& lease) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = leases_.find(lease.id());
        if (it == leases_.end()) return;
        auto cit = connections_.find(it->second);
        if (cit == connections_.end()) return;
        cit->second->mark_degraded();
        logger()->debug("connection {} to {} marked degraded", it->second,
                        origin_.to_string());
    }

    // -------------------------
    // idle reaping
    // -------------------------

    std::size_t ConnectionPool::reap_idle(clock_type::time_point now) {
        Deferred d;
        std::size_t reaped = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (state_ == PoolState::Closed) return 0;

            for (auto it = connections_.begin(); it != connections_.end();) {
                auto& conn = *it->second;
                if (!conn.is_idle()) {
                    ++it;
                    continue;
                }
                if (conn.idle_expired(now,
                                      settings_.connection_max_idle_time)) {
                    metrics_.connection_reaped_idle.fetch_add(1, relaxed);
                } else if (conn.ttl_expired(
                               now, settings_.connection_time_to_live)) {
                    metrics_.connection_expired_ttl.fetch_add(1, relaxed);
                } else if (!conn.is_open() ||
                           conn.health() != ConnectionHealth::Healthy) {
                    metrics_.connection_dropped_unhealthy.fetch_add(1,
                                                                    relaxed);
                } else {
                    ++it;
                    continue;
                }
                it = remove_connection_locked_(it, d);
                ++reaped;
            }

            if (reaped != 0 && state_ == PoolState::Active) {
                serve_waiters_locked_(now, d);
            }
            check_invariants_locked_();
        }

        if (reaped != 0) {
            logger()->debug("reaped {} idle connections to {}", reaped,
                            origin_.to_string());
        }
        run_deferred(d);
        return reaped;
    }

    void ConnectionPool::start_reaper() {
        reaper_timer_ = std::make_shared<boost::asio::steady_timer>(strand_);
        std::weak_ptr<ConnectionPool> weak = weak_from_this();
        auto timer = reaper_timer_;
        auto interval = settings_.idle_reaper_interval;
        boost::asio::co_spawn(
            strand_,
            [weak, timer, interval]() -> awaitable_void {
                co_await run_reaper(weak, timer, interval);
            },
            boost::asio::detached);
    }

    awaitable_void ConnectionPool::run_reaper(
        std::weak_ptr<ConnectionPool> weak,
        std::shared_ptr<boost::asio::steady_timer> timer,
        std::chrono::milliseconds interval) {
        for (;;) {
            timer->expires_after(interval);
            boost::system::error_code ec;
            co_await timer->async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) co_return;

            auto self = weak.lock();
            if (!self || self->state() != PoolState::Active) co_return;
            try {
                self->reap_idle(clock_type::now());
            } catch (const std::exception& e) {
                logger()->error("idle sweep for {} failed: {}",
                                self->origin_.to_string(), e.what());
            }
        }
    }

    // -------------------------
    // close
    // -------------------------

    awaitable_void ConnectionPool::close() {
        co_await close(settings_.close_grace_period);
    }

    awaitable_void ConnectionPool::close(std::chrono::milliseconds grace) {
        auto self = shared_from_this();
        auto on_strand = [self, grace]() -> awaitable_void {
            co_await close_on_strand(self, grace);
        };
        co_await boost::asio::co_spawn(strand_, std::move(on_strand),
                                       boost::asio::use_awaitable);
    }

    awaitable_void ConnectionPool::close_on_strand(
        std::shared_ptr<ConnectionPool> self, std::chrono::milliseconds grace) {
        std::shared_ptr<boost::asio::steady_timer> drain;
        std::size_t in_flight = 0;
        bool first = false;
        {
            Deferred d;
            {
                std::lock_guard<std::mutex> lk(self->mu_);
                if (self->state_ == PoolState::Active) {
                    first = true;
                    self->state_ = PoolState::Draining;
                    self->fail_waiters_locked_(
                        Error{Error::Code::PoolClosed,
                              "connection pool for " +
                                  self->origin_.to_string() + " is closing"},
                        d);
                    in_flight = self->active_leases_;
                    if (in_flight != 0) {
                        self->drain_timer_ =
                            std::make_shared<boost::asio::steady_timer>(
                                self->strand_);
                        self->drain_timer_->expires_after(grace);
                        drain = self->drain_timer_;
                    }
                }
            }
            if (first && self->reaper_timer_) self->reaper_timer_->cancel();
            self->run_deferred(d);
        }
        if (!first) co_return;

        logger()->debug("closing pool for {}: {} in-flight leases, grace {} ms",
                        self->origin_.to_string(), in_flight, grace.count());

        if (drain) {
            boost::system::error_code ec;
            co_await drain->async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }

        std::size_t forced = 0;
        Deferred d;
        {
            std::lock_guard<std::mutex> lk(self->mu_);
            self->state_ = PoolState::Closed;
            forced = self->leases_.size();
            self->fail_waiters_locked_(
                Error{Error::Code::PoolClosed,
                      "connection pool for " + self->origin_.to_string() +
                          " is closed"},
                d);
            self->revoke_leases_locked_(d);
            self->drain_timer_.reset();
        }

        if (forced != 0) {
            logger()->warn(
                "force-cancelled {} leases on {} after {} ms grace period",
                forced, self->origin_.to_string(), grace.count());
        }
        self->run_deferred(d);
        logger()->debug("pool for {} closed", self->origin_.to_string());
    }

    void ConnectionPool::close_now() noexcept {
        try {
            Deferred d;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (state_ == PoolState::Closed) return;
                state_ = PoolState::Closed;
                fail_waiters_locked_(
                    Error{Error::Code::PoolClosed,
                          "connection pool for " + origin_.to_string() +
                              " is closed"},
                    d);
                revoke_leases_locked_(d);
                d.drain = drain_timer_;
            }
            if (reaper_timer_) {
                boost::asio::post(strand_,
                                  [t = reaper_timer_] { t->cancel(); });
            }
            run_deferred(d);
            logger()->debug("pool for {} closed immediately",
                            origin_.to_string());
        } catch (const std::exception& e) {
            logger()->error("error closing pool for {}: {}",
                            origin_.to_string(), e.what());
        }
    }

    // -------------------------
    // stats
    // -------------------------

    PoolStats ConnectionPool::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        PoolStats out;
        out.state = state_;
        out.active_leases = active_leases_;
        out.connections = connections_.size();
        for (auto const& [id, conn] : connections_) {
            (void)id;
            if (conn->is_idle()) ++out.idle_connections;
        }
        out.pending_acquires = waiters_.size();
        out.last_activity = last_activity_;
        return out;
    }

    PoolState ConnectionPool::state() const {
        std::lock_guard<std::mutex> lk(mu_);
        return state_;
    }

    // -------------------------
    // helpers (mu_ held)
    // -------------------------

    ConnectionPool::Grant ConnectionPool::try_grant_locked_(
        clock_type::time_point now, Deferred& d) {
        Grant g;
        if (state_ != PoolState::Active) return g;
        if (active_leases_ >= settings_.max_concurrency) return g;

        drop_dead_idle_locked_(now, d);

        PooledConnection* chosen = nullptr;
        for (auto& [id, conn] : connections_) {
            (void)id;
            if (!conn->is_leasable()) continue;
            if (conn->ttl_expired(now, settings_.connection_time_to_live)) {
                continue;
            }
            chosen = conn.get();
            break;
        }

        if (chosen) {
            metrics_.connection_reused.fetch_add(1, relaxed);
        } else {
            if (connections_.size() >= settings_.max_concurrency) return g;

            auto channel = transport_->open(origin_, limits_, ex_);
            if (!channel) {
                logger()->warn("failed to open channel to {}: {}",
                               origin_.to_string(), channel.error().message);
                g.error = std::move(channel).error();
                return g;
            }

            const auto id = next_connection_id_++;
            auto conn = make_pooled_connection(
                limits_, id, std::move(channel).value(), now);
            chosen = conn.get();
            connections_.emplace(id, std::move(conn));
            metrics_.connection_created.fetch_add(1, relaxed);
            logger()->debug("opened connection {} to {} ({} connections)", id,
                            origin_.to_string(), connections_.size());
        }

        if (!chosen->try_reserve()) return g;
        chosen->touch(now);

        const auto lease_id = next_lease_id_++;
        leases_.emplace(lease_id, chosen->id());
        ++active_leases_;
        g.lease.emplace(Lease(weak_from_this(), lease_id, chosen->id(),
                              chosen->channel(), limits_.protocol));
        return g;
    }

    void ConnectionPool::serve_waiters_locked_(clock_type::time_point now,
                                               Deferred& d) {
        while (!waiters_.empty() && state_ == PoolState::Active) {
            auto g = try_grant_locked_(now, d);
            if (!g.lease && !g.error) break;

            auto w = std::move(waiters_.front());
            waiters_.pop_front();
            if (g.lease) {
                w->lease = std::move(g.lease);
            } else {
                w->error = std::move(g.error);
            }
            d.to_wake.push_back(std::move(w));
        }
    }

    void ConnectionPool::drop_dead_idle_locked_(clock_type::time_point now,
                                                Deferred& d) {
        for (auto it = connections_.begin(); it != connections_.end();) {
            auto& conn = *it->second;
            if (!conn.is_idle()) {
                ++it;
                continue;
            }
            if (conn.ttl_expired(now, settings_.connection_time_to_live)) {
                metrics_.connection_expired_ttl.fetch_add(1, relaxed);
            } else if (conn.idle_expired(now,
                                         settings_.connection_max_idle_time)) {
                metrics_.connection_reaped_idle.fetch_add(1, relaxed);
            } else if (!conn.is_open() ||
                       conn.health() != ConnectionHealth::Healthy) {
                metrics_.connection_dropped_unhealthy.fetch_add(1, relaxed);
            } else {
                ++it;
                continue;
            }
            it = remove_connection_locked_(it, d);
        }
    }

    ConnectionPool::connection_map::iterator
    ConnectionPool::remove_connection_locked_(connection_map::iterator it,
                                              Deferred& d) {
        it->second->mark_closing();
        if (it->second->channel()) d.to_close.push_back(it->second->channel());
        return connections_.erase(it);
    }

    void ConnectionPool::fail_waiters_locked_(Error const& error,
                                              Deferred& d) {
        for (auto& w : waiters_) {
            w->error = error;
            metrics_.acquire_pool_closed.fetch_add(1, relaxed);
            d.to_wake.push_back(std::move(w));
        }
        waiters_.clear();
    }

    void ConnectionPool::revoke_leases_locked_(Deferred& d) {
        for (auto const& [lease_id, conn_id] : leases_) {
            (void)conn_id;
            revoked_.insert(lease_id);
            metrics_.lease_force_cancelled.fetch_add(1, relaxed);
        }
        leases_.clear();
        active_leases_ = 0;

        for (auto& [id, conn] : connections_) {
            (void)id;
            conn->mark_closing();
            if (!conn->channel()) continue;
            if (conn->is_idle()) {
                d.to_close.push_back(conn->channel());
            } else {
                d.to_abort.push_back(conn->channel());
            }
        }
        connections_.clear();
    }

    void ConnectionPool::run_deferred(Deferred& d) noexcept {
        for (auto& ch : d.to_abort) transport_->abort(*ch);
        for (auto& ch : d.to_close) transport_->close(*ch);
        d.to_abort.clear();
        d.to_close.clear();

        if (d.to_wake.empty() && !d.drain) return;
        try {
            boost::asio::post(strand_, [waiters = std::move(d.to_wake),
                                        drain = std::move(d.drain)] {
                for (auto& w : waiters) {
                    if (w->timer) w->timer->cancel();
                }
                if (drain) drain->cancel();
            });
        } catch (const std::exception& e) {
            logger()->error("failed to wake waiters on {}: {}",
                            origin_.to_string(), e.what());
        }
    }

    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        assert(active_leases_ <= settings_.max_concurrency &&
               "active leases above max concurrency");
        assert(leases_.size() == active_leases_ && "lease count drift");

        std::size_t streams = 0;
        for (auto const& [id, conn] : connections_) {
            (void)id;
            assert(conn && "pooled connection is null");
            streams += conn->active_streams();
        }
        assert(streams == active_leases_ && "stream count drift");
#else
        return;
#endif
    }

}  // namespace muxpool

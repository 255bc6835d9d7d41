#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "muxpool/cancellation.hpp"
#include "muxpool/config.hpp"
#include "muxpool/connection/connection.hpp"
#include "muxpool/connection/connection_pool_types.hpp"
#include "muxpool/origin.hpp"
#include "muxpool/result.hpp"
#include "muxpool/transport/transport.hpp"

namespace muxpool {

    /**
     * Per-origin pool of connections with a FIFO wait queue.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - Pool state is protected by a mutex
     * - Waiter and reaper timers are only touched on the pool's strand
     *
     * INVARIANTS:
     * 1. active_leases_ <= max_concurrency
     * 2. waiters_.size() <= max_pending_acquires
     * 3. active_leases_ == leases_.size() == sum(conn.active_streams())
     * 4. A waiter is served only after every waiter queued before it
     * 5. A connection with at least one lease is never closed by the reaper
     *
     * ERRORS:
     * - CapacityExceeded: wait queue full, fails without waiting
     * - AcquisitionTimeout: not served within the timeout, may be retried
     * - PoolClosed: close() has begun, will never succeed
     * - Cancelled: the caller's cancellation token fired
     * - TransportFailure (or the transport's own code): channel creation
     *   failed
     *
     * LIFECYCLE:
     * 1. create(): pool is Active, reaper started if enabled
     * 2. acquire()/release() work normally
     * 3. close(): Draining, pending waiters fail, in-flight leases get the
     *    grace period, leftovers are force-cancelled
     * 4. Closed: every connection closed, leases inert
     *
     * A pool must be owned by a std::shared_ptr (see create()); leases refer
     * back to it weakly.
     */
    class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
       public:
        using clock_type = std::chrono::steady_clock;
        using executor_type = boost::asio::any_io_executor;

        /// @brief Pool limits and lifetimes, fixed at creation.
        struct Settings {
            std::size_t max_concurrency{50};
            std::size_t max_pending_acquires{10000};
            std::chrono::milliseconds connection_max_idle_time{
                std::chrono::seconds(5)};
            std::chrono::milliseconds connection_time_to_live{0};
            bool use_idle_connection_reaper{true};
            std::chrono::milliseconds idle_reaper_interval{
                std::chrono::seconds(1)};
            std::chrono::milliseconds close_grace_period{
                std::chrono::seconds(5)};

            static Settings from(const ClientConfiguration& cfg) {
                Settings s;
                s.max_concurrency = cfg.max_concurrency;
                s.max_pending_acquires = cfg.max_pending_acquires;
                s.connection_max_idle_time = cfg.connection_max_idle_time;
                s.connection_time_to_live = cfg.connection_time_to_live;
                s.use_idle_connection_reaper = cfg.use_idle_connection_reaper;
                s.idle_reaper_interval = cfg.idle_reaper_interval;
                s.close_grace_period = cfg.pool_close_grace_period;
                return s;
            }
        };

        /**
         * @brief Exclusive right to one request slot on a connection.
         *
         * Released exactly once: explicitly through release(), or by the
         * destructor. A lease force-cancelled by close() becomes inert and
         * its release is a no-op.
         */
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { reset(); }

            /// @brief Channel of the leased connection, or nullptr if this
            /// lease is empty or released.
            std::shared_ptr<Channel> const& channel() const noexcept {
                return channel_;
            }

            explicit operator bool() const noexcept { return id_ != 0; }

            std::uint64_t id() const noexcept { return id_; }

            std::uint64_t connection_id() const noexcept {
                return connection_id_;
            }

            Protocol protocol() const noexcept { return protocol_; }

            /// @brief Return the slot to the pool.
            /// @throws std::logic_error if empty or already released.
            void release();

           private:
            friend class ConnectionPool;

            Lease(std::weak_ptr<ConnectionPool> pool, std::uint64_t id,
                  std::uint64_t connection_id, std::shared_ptr<Channel> ch,
                  Protocol protocol)
                : pool_(std::move(pool)),
                  channel_(std::move(ch)),
                  id_(id),
                  connection_id_(connection_id),
                  protocol_(protocol) {}

            /// @brief Return the slot if still held; used by the destructor
            void reset() noexcept;

            void move_from(Lease&& other) noexcept {
                pool_ = std::move(other.pool_);
                channel_ = std::move(other.channel_);
                id_ = other.id_;
                connection_id_ = other.connection_id_;
                protocol_ = other.protocol_;
                other.id_ = 0;
                other.connection_id_ = 0;
            }

            std::weak_ptr<ConnectionPool> pool_;
            std::shared_ptr<Channel> channel_;
            std::uint64_t id_{0};
            std::uint64_t connection_id_{0};
            Protocol protocol_{Protocol::Http1_1};
        };

        static std::shared_ptr<ConnectionPool> create(
            executor_type ex, OriginKey origin, ProtocolLimits limits,
            Settings settings, std::shared_ptr<Transport> transport);

        ~ConnectionPool();

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /**
         * @brief Acquire a lease, waiting in FIFO order if needed.
         * @param timeout Max time spent in the wait queue.
         * @param cancel Cancels the wait; a slot already handed to this
         * request is released.
         */
        boost::asio::awaitable<Result<Lease>> acquire(
            clock_type::duration timeout = clock_type::duration::max(),
            CancellationToken cancel = {});

        /// @brief Acquire without waiting. Never jumps the wait queue.
        std::optional<Lease> try_acquire();

        /// @brief Return a lease's slot.
        /// @throws std::logic_error for an unknown, foreign or already
        /// released lease.
        void release(Lease& lease);

        /// @brief Stop giving new leases to the lease's connection; it is
        /// closed once idle.
        void mark_degraded(const Lease& lease);

        /// @brief One idle sweep. Returns the number of connections closed.
        std::size_t reap_idle(clock_type::time_point now = clock_type::now());

        /// @brief Graceful close with the configured grace period.
        boost::asio::awaitable<void> close();

        /// @brief Graceful close: drain for up to grace, then force-cancel.
        boost::asio::awaitable<void> close(std::chrono::milliseconds grace);

        /// @brief Immediate close without draining.
        void close_now() noexcept;

        PoolStats stats() const;

        PoolState state() const;

        ConnectionPoolMetrics const& metrics() const noexcept {
            return metrics_;
        }

        OriginKey const& origin() const noexcept { return origin_; }

        ProtocolLimits const& limits() const noexcept { return limits_; }

        Settings const& settings() const noexcept { return settings_; }

       private:
        ConnectionPool(executor_type ex, OriginKey origin,
                       ProtocolLimits limits, Settings settings,
                       std::shared_ptr<Transport> transport);

        /// @brief Queued acquire request.
        struct Waiter {
            std::shared_ptr<boost::asio::steady_timer> timer;
            std::optional<Lease> lease;  ///< Set when served
            std::optional<Error> error;  ///< Set when failed

            bool pending() const noexcept { return !lease && !error; }
        };

        /// @brief Result of a grant attempt under lock.
        struct Grant {
            std::optional<Lease> lease;
            std::optional<Error> error;
        };

        /// @brief Side effects collected under lock, run after unlocking.
        struct Deferred {
            std::vector<std::shared_ptr<Channel>> to_close;
            std::vector<std::shared_ptr<Channel>> to_abort;
            std::vector<std::shared_ptr<Waiter>> to_wake;
            std::vector<Lease> to_drop;
            std::shared_ptr<boost::asio::steady_timer> drain;
        };

        struct AcquireOutcome {
            std::optional<Lease> lease;
            std::optional<Error> error;
        };

        static boost::asio::awaitable<AcquireOutcome> acquire_on_strand(
            std::shared_ptr<ConnectionPool> self, clock_type::duration timeout,
            CancellationToken cancel);

        static boost::asio::awaitable<void> close_on_strand(
            std::shared_ptr<ConnectionPool> self,
            std::chrono::milliseconds grace);

        static boost::asio::awaitable<void> run_reaper(
            std::weak_ptr<ConnectionPool> weak,
            std::shared_ptr<boost::asio::steady_timer> timer,
            std::chrono::milliseconds interval);

        void start_reaper();

        Grant try_grant_locked_(clock_type::time_point now, Deferred& d);

        void serve_waiters_locked_(clock_type::time_point now, Deferred& d);

        void drop_dead_idle_locked_(clock_type::time_point now, Deferred& d);

        using connection_map =
            std::map<std::uint64_t, std::unique_ptr<PooledConnection>>;

        connection_map::iterator remove_connection_locked_(
            connection_map::iterator it, Deferred& d);

        void fail_waiters_locked_(Error const& error, Deferred& d);

        void revoke_leases_locked_(Deferred& d);

        /// @brief Release path shared by Lease::release and the destructor.
        /// @return false if the lease was unknown.
        bool release_lease(std::uint64_t lease_id) noexcept;

        void run_deferred(Deferred& d) noexcept;

        void cancel_waiter(std::shared_ptr<Waiter> const& w);

        void check_invariants_locked_() const;

        executor_type ex_;
        boost::asio::strand<executor_type> strand_;
        OriginKey origin_;
        ProtocolLimits limits_;
        Settings settings_;
        std::shared_ptr<Transport> transport_;

        mutable std::mutex mu_;
        PoolState state_{PoolState::Active};
        /// Ordered by id, oldest first.
        connection_map connections_;
        /// lease id -> connection id
        std::unordered_map<std::uint64_t, std::uint64_t> leases_;
        /// Leases revoked by close(); their late release is a no-op.
        std::unordered_set<std::uint64_t> revoked_;
        std::list<std::shared_ptr<Waiter>> waiters_;
        std::size_t active_leases_{0};
        std::uint64_t next_connection_id_{1};
        std::uint64_t next_lease_id_{1};
        clock_type::time_point last_activity_{clock_type::now()};

        std::shared_ptr<boost::asio::steady_timer> reaper_timer_;
        std::shared_ptr<boost::asio::steady_timer> drain_timer_;

        ConnectionPoolMetrics metrics_;
    };

}  // namespace muxpool

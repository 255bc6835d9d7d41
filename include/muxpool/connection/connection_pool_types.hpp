#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "muxpool/config.hpp"

namespace muxpool {

    /// @brief ConnectionPool state machine: Active -> Draining -> Closed.
    enum class PoolState {
        Active,    ///< Accepting acquires
        Draining,  ///< Close began, waiting for in-flight leases
        Closed     ///< All connections released
    };

    inline const char* to_string(PoolState s) {
        switch (s) {
            case PoolState::Active:
                return "Active";
            case PoolState::Draining:
                return "Draining";
            case PoolState::Closed:
                return "Closed";
        }
        return "Unknown";
    }

    /// @brief Health of a pooled connection.
    enum class ConnectionHealth {
        Healthy,   ///< Eligible for new leases
        Degraded,  ///< No new leases, closed once idle
        Closing    ///< Being torn down
    };

    /**
     * @brief Limits negotiated once per pool, fixed for the pool's lifetime.
     */
    struct ProtocolLimits {
        Protocol protocol{Protocol::Http1_1};
        /// Streams per connection: 1 for HTTP/1.1.
        std::uint64_t max_concurrent_streams{1};
        /// HTTP/2 initial flow-control window in bytes.
        std::uint32_t initial_window_size{1048576};
        /// HTTP/2 keep-alive PING period, if enabled.
        std::optional<std::chrono::milliseconds> health_check_ping_period;
    };

    /// @brief Snapshot of a pool's gauges, taken under the pool lock.
    struct PoolStats {
        PoolState state{PoolState::Active};
        std::size_t active_leases{0};
        std::size_t connections{0};
        std::size_t idle_connections{0};
        std::size_t pending_acquires{0};
        std::chrono::steady_clock::time_point last_activity{};
    };

    /// @brief Cumulative counters for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        std::atomic<std::uint64_t> acquire_success{0};  ///< Leases granted
        std::atomic<std::uint64_t> acquire_queued{0};   ///< Had to wait
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Waited too long
        std::atomic<std::uint64_t> acquire_capacity_exceeded{
            0};                                          ///< Queue was full
        std::atomic<std::uint64_t> acquire_pool_closed{0};  ///< After close
        std::atomic<std::uint64_t> acquire_cancelled{0};    ///< By caller
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> connection_reaped_idle{
            0};  ///< Closed by idle sweep (max idle time)
        std::atomic<std::uint64_t> connection_expired_ttl{
            0};  ///< Closed after time-to-live
        std::atomic<std::uint64_t> connection_dropped_unhealthy{
            0};  ///< Closed because degraded or closed by peer
        std::atomic<std::uint64_t> lease_released{0};  ///< Normal releases
        std::atomic<std::uint64_t> lease_force_cancelled{
            0};  ///< Revoked by close() after the grace period
        std::atomic<std::uint64_t> release_invalid{
            0};  ///< Double or unknown release attempts
    };

}  // namespace muxpool

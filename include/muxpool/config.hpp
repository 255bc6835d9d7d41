#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "muxpool/result.hpp"

namespace muxpool {

    class EventLoopGroup;

    /** @brief Wire protocol a pool speaks to its origin. */
    enum class Protocol {
        Http1_1, /**< One request per connection lease. */
        Http2    /**< Many concurrent streams per connection. */
    };

    inline const char* to_string(Protocol p) {
        return p == Protocol::Http2 ? "HTTP/2" : "HTTP/1.1";
    }

    /**
     * @brief Structured HTTP/2 settings. Unset fields fall back to defaults
     * when a pool is created.
     */
    struct Http2Configuration {
        /** @brief Max concurrent streams per connection. */
        std::optional<std::uint64_t> max_streams;
        /** @brief Initial flow-control window in bytes. */
        std::optional<std::uint32_t> initial_window_size;
        /** @brief Keep-alive PING interval for idle connections. */
        std::optional<std::chrono::milliseconds> health_check_ping_period;
    };

    /**
     * @brief Forward proxy settings handed to the Transport.
     */
    struct ProxyConfiguration {
        std::string scheme{"http"};
        std::string host;
        std::uint16_t port{0};
        /** @brief Hosts (lower-case, exact match) that bypass the proxy. */
        std::vector<std::string> non_proxy_hosts;

        bool enabled() const noexcept { return !host.empty() && port != 0; }
    };

    /**
     * @brief Options for an event-loop group this client creates and owns.
     */
    struct EventLoopGroupOptions {
        /** @brief Worker threads, 0 means hardware concurrency. */
        std::size_t thread_count{0};
        /** @brief Prefix for worker thread names (visible in debuggers). */
        std::string thread_name_prefix{"muxpool-io"};
    };

    /**
     * @brief Where worker threads come from.
     *
     * Exactly one of the following applies:
     * - `group` set: caller-supplied group, borrowed, never shut down here.
     * - `options` set: a new group is built and owned by the client.
     * - neither: the process-wide shared default group (reference counted).
     */
    struct EventLoopConfiguration {
        std::shared_ptr<EventLoopGroup> group;
        std::optional<EventLoopGroupOptions> options;
    };

    /**
     * @brief Timings for graceful event-loop shutdown.
     */
    struct ShutdownConfiguration {
        /** @brief Time allowed for in-flight work to drain on its own. */
        std::chrono::milliseconds quiet_period{std::chrono::seconds(2)};
        /** @brief Deadline after which worker threads are force-stopped. */
        std::chrono::milliseconds timeout{std::chrono::seconds(15)};
        /** @brief Upper bound for the whole shutdown call. */
        std::chrono::milliseconds outer_timeout{std::chrono::seconds(16)};
    };

    /**
     * @brief Logger settings, applied when the client is constructed.
     */
    struct LoggingConfiguration {
        /** @brief spdlog level name: trace, debug, info, warn, error, off. */
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    };

    /**
     * @brief Configuration for the AsyncHttpClient and its connection pools.
     *
     * Precedence for HTTP/2 limits, highest first: `max_http2_streams`, then
     * `http2`, then the built-in default. Values are resolved once per pool,
     * when the pool is created.
     */
    struct ClientConfiguration {
        /** @brief Max concurrent leases per origin (connections for HTTP/1.1,
         * streams for HTTP/2). */
        std::size_t max_concurrency{50};

        /** @brief Max queued acquires per origin before failing fast. */
        std::size_t max_pending_acquires{10000};

        /** @brief Timeout for reading a response. */
        std::chrono::milliseconds read_timeout{std::chrono::seconds(30)};

        /** @brief Timeout for writing a request. */
        std::chrono::milliseconds write_timeout{std::chrono::seconds(30)};

        /** @brief Timeout for establishing a connection. */
        std::chrono::milliseconds connect_timeout{std::chrono::seconds(2)};

        /** @brief Max time a request may wait in the pool queue. */
        std::chrono::milliseconds acquire_timeout{std::chrono::seconds(10)};

        /** @brief Idle time after which a connection is closed. */
        std::chrono::milliseconds connection_max_idle_time{
            std::chrono::seconds(5)};

        /** @brief Max lifetime of a connection, zero means unlimited. */
        std::chrono::milliseconds connection_time_to_live{0};

        /** @brief TLS handshake timeout, defaults to connect_timeout. */
        std::optional<std::chrono::milliseconds> tls_negotiation_timeout;

        /** @brief Whether idle connections are reaped in the background. */
        bool use_idle_connection_reaper{true};

        /** @brief Interval between idle sweeps. */
        std::chrono::milliseconds idle_reaper_interval{
            std::chrono::seconds(1)};

        /** @brief Time close() waits for in-flight leases before force
         * cancelling them. */
        std::chrono::milliseconds pool_close_grace_period{
            std::chrono::seconds(5)};

        /** @brief Protocol for newly created pools. */
        Protocol protocol{Protocol::Http1_1};

        /** @brief Top-level override for HTTP/2 max concurrent streams. */
        std::optional<std::uint64_t> max_http2_streams;

        /** @brief Structured HTTP/2 settings. */
        Http2Configuration http2;

        std::optional<ProxyConfiguration> proxy;

        /** @brief Enable SO_KEEPALIVE on TCP sockets. */
        bool tcp_keep_alive{false};

        /** @brief Whether to verify TLS certificates. */
        bool verify_tls{true};

        /** @brief User-Agent header sent with each request. */
        std::string user_agent{"muxpool/1.0"};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U *
                                   1024U};

        EventLoopConfiguration event_loop;

        ShutdownConfiguration shutdown;

        LoggingConfiguration logging;

        /** @brief Effective TLS handshake timeout. */
        std::chrono::milliseconds effective_tls_negotiation_timeout() const {
            return tls_negotiation_timeout.value_or(connect_timeout);
        }

        /** @brief Check settings for contradictions. */
        Status validate() const;
    };

}  // namespace muxpool

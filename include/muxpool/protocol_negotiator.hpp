#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

#include "muxpool/config.hpp"
#include "muxpool/connection/connection_pool_types.hpp"

namespace muxpool {

    /**
     * @brief Resolves the ProtocolLimits a new pool will use.
     *
     * Resolution happens once, at pool creation. Precedence, highest first:
     * the top-level override, the structured Http2Configuration value, the
     * hard-coded default. update() only affects pools created afterwards.
     *
     * SAFETY: all methods are thread-safe.
     */
    class ProtocolNegotiator {
       public:
        /// Protocol ceiling for max concurrent streams (unsigned 32-bit).
        static constexpr std::uint64_t kMaxStreamsAllowed = 4294967295ULL;
        /// Default HTTP/2 initial window size (1 MiB).
        static constexpr std::uint32_t kDefaultInitialWindowSize = 1048576U;

        struct Defaults {
            Protocol protocol{Protocol::Http1_1};
            std::optional<std::uint64_t> max_streams_override;
            Http2Configuration http2;
        };

        ProtocolNegotiator() = default;
        explicit ProtocolNegotiator(Defaults defaults)
            : defaults_(std::move(defaults)) {}

        /// @brief Take protocol, override and HTTP/2 settings from a client
        /// configuration.
        static Defaults defaults_from(const ClientConfiguration& cfg) {
            return Defaults{cfg.protocol, cfg.max_http2_streams, cfg.http2};
        }

        /// @brief Limits for a pool created now.
        ProtocolLimits resolve() const;

        /// @brief Replace the client-wide defaults for future pools.
        void update(Defaults defaults);

        Defaults defaults() const;

        static std::uint64_t resolve_max_streams(
            std::optional<std::uint64_t> top_level_value,
            const Http2Configuration& http2) noexcept;

        static std::uint32_t resolve_initial_window_size(
            const Http2Configuration& http2) noexcept;

        static std::optional<std::chrono::milliseconds>
        resolve_health_check_ping_period(const Http2Configuration& http2) {
            return http2.health_check_ping_period;
        }

       private:
        mutable std::mutex mu_;
        Defaults defaults_;
    };

}  // namespace muxpool

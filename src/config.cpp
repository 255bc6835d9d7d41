#include "muxpool/config.hpp"

#include <string>

namespace muxpool {

    namespace {
        constexpr std::uint32_t kMaxHttp2WindowSize = 2147483647U;

        Status invalid(std::string msg) {
            return Status::err(Error::Code::InvalidConfiguration,
                               std::move(msg));
        }
    }  // namespace

    Status ClientConfiguration::validate() const {
        if (max_concurrency == 0) {
            return invalid("max_concurrency must be at least 1");
        }

        if (event_loop.group && event_loop.options) {
            return invalid(
                "an event loop group and event loop group options can't both "
                "be configured");
        }

        if (max_http2_streams && *max_http2_streams == 0) {
            return invalid("max_http2_streams must be at least 1");
        }
        if (http2.max_streams && *http2.max_streams == 0) {
            return invalid("http2.max_streams must be at least 1");
        }
        if (http2.initial_window_size &&
            *http2.initial_window_size > kMaxHttp2WindowSize) {
            return invalid("http2.initial_window_size exceeds 2^31-1");
        }
        if (http2.health_check_ping_period &&
            http2.health_check_ping_period->count() < 0) {
            return invalid("http2.health_check_ping_period is negative");
        }

        if (connect_timeout.count() <= 0) {
            return invalid("connect_timeout must be positive");
        }
        if (use_idle_connection_reaper && idle_reaper_interval.count() <= 0) {
            return invalid("idle_reaper_interval must be positive");
        }
        if (connection_max_idle_time.count() < 0 ||
            connection_time_to_live.count() < 0) {
            return invalid("connection lifetimes can't be negative");
        }

        if (shutdown.quiet_period > shutdown.timeout ||
            shutdown.timeout > shutdown.outer_timeout) {
            return invalid(
                "shutdown timings must satisfy quiet_period <= timeout <= "
                "outer_timeout");
        }

        if (proxy && proxy->enabled() && proxy->scheme != "http" &&
            proxy->scheme != "https") {
            return invalid("proxy scheme must be http or https");
        }

        return Status::ok();
    }

}  // namespace muxpool

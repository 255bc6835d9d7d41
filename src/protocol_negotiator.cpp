#include "muxpool/protocol_negotiator.hpp"

#include <algorithm>

namespace muxpool {

    namespace {
        std::uint64_t clamp_streams(std::uint64_t v) noexcept {
            return std::clamp<std::uint64_t>(
                v, 1, ProtocolNegotiator::kMaxStreamsAllowed);
        }
    }  // namespace

    std::uint64_t ProtocolNegotiator::resolve_max_streams(
        std::optional<std::uint64_t> top_level_value,
        const Http2Configuration& http2) noexcept {
        if (top_level_value) return clamp_streams(*top_level_value);
        if (http2.max_streams) return clamp_streams(*http2.max_streams);
        return kMaxStreamsAllowed;
    }

    std::uint32_t ProtocolNegotiator::resolve_initial_window_size(
        const Http2Configuration& http2) noexcept {
        return http2.initial_window_size.value_or(kDefaultInitialWindowSize);
    }

    ProtocolLimits ProtocolNegotiator::resolve() const {
        Defaults d = defaults();

        ProtocolLimits out;
        out.protocol = d.protocol;
        out.initial_window_size = resolve_initial_window_size(d.http2);
        out.health_check_ping_period =
            resolve_health_check_ping_period(d.http2);
        out.max_concurrent_streams =
            d.protocol == Protocol::Http2
                ? resolve_max_streams(d.max_streams_override, d.http2)
                : 1;
        return out;
    }

    void ProtocolNegotiator::update(Defaults defaults) {
        std::lock_guard<std::mutex> lk(mu_);
        defaults_ = std::move(defaults);
    }

    ProtocolNegotiator::Defaults ProtocolNegotiator::defaults() const {
        std::lock_guard<std::mutex> lk(mu_);
        return defaults_;
    }

}  // namespace muxpool

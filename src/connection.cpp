#include "muxpool/connection/connection.hpp"

namespace muxpool {

    std::unique_ptr<PooledConnection> make_pooled_connection(
        const ProtocolLimits& limits, std::uint64_t id,
        std::shared_ptr<Channel> channel,
        PooledConnection::clock_type::time_point now) {
        if (limits.protocol == Protocol::Http2) {
            return std::make_unique<Http2Connection>(
                id, std::move(channel), now, limits.max_concurrent_streams);
        }
        return std::make_unique<Http1Connection>(id, std::move(channel), now);
    }

}  // namespace muxpool

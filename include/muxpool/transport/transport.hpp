#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>

#include "muxpool/connection/connection_pool_types.hpp"
#include "muxpool/origin.hpp"
#include "muxpool/request.hpp"
#include "muxpool/response.hpp"
#include "muxpool/result.hpp"

namespace muxpool {

    /**
     * @brief One physical transport channel (socket, TLS session, codec
     * state) as produced by a Transport.
     *
     * A channel may connect lazily on its first exchange. The pool only asks
     * whether it is still usable.
     */
    class Channel {
       public:
        explicit Channel(OriginKey origin) : origin_(std::move(origin)) {}
        virtual ~Channel() = default;

        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;

        /// @brief False once the peer or the transport closed the channel.
        virtual bool is_open() const noexcept = 0;

        const OriginKey& origin() const noexcept { return origin_; }

       private:
        OriginKey origin_;
    };

    /**
     * @brief Supplies TLS, socket and codec behavior to the pool.
     *
     * Implementations must be thread-safe: open() is called from any thread
     * while the pool lock is held and must not block, and abort() may be
     * called from a cancellation callback while perform_exchange() is in
     * flight.
     */
    class Transport {
       public:
        virtual ~Transport() = default;

        /// @brief Whether this transport can drive the given protocol.
        virtual bool supports(Protocol protocol) const noexcept = 0;

        /// @brief Create a channel for the origin. Connecting may be
        /// deferred to the first exchange.
        virtual Result<std::shared_ptr<Channel>> open(
            const OriginKey& origin, const ProtocolLimits& limits,
            boost::asio::any_io_executor ex) = 0;

        /// @brief Perform one request/response exchange on the channel.
        ///
        /// On a multiplexed channel, request.cancellation ends this exchange
        /// only (a stream reset) and leaves the channel to its other streams.
        virtual boost::asio::awaitable<Result<Response>> perform_exchange(
            std::shared_ptr<Channel> channel, const PreparedRequest& request) = 0;

        /// @brief Graceful close. Idempotent, never throws.
        virtual void close(Channel& channel) noexcept = 0;

        /// @brief Abort the channel and whatever exchange it carries. Used
        /// for cancellation only on HTTP/1.1 channels. Defaults to close().
        virtual void abort(Channel& channel) noexcept { close(channel); }
    };

}  // namespace muxpool

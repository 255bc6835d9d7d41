#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "muxpool/config.hpp"
#include "muxpool/transport/transport.hpp"

namespace muxpool {

    /** @brief Socket, TLS and HTTP settings of a BeastTransport. */
    struct BeastTransportOptions {
        std::chrono::milliseconds connect_timeout{std::chrono::seconds(2)};
        std::chrono::milliseconds tls_negotiation_timeout{
            std::chrono::seconds(2)};
        std::chrono::milliseconds read_timeout{std::chrono::seconds(30)};
        std::chrono::milliseconds write_timeout{std::chrono::seconds(30)};
        std::string user_agent{"muxpool/1.0"};
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U *
                                   1024U};
        bool tcp_keep_alive{false};
        bool verify_tls{true};
        std::optional<ProxyConfiguration> proxy;

        static BeastTransportOptions from(const ClientConfiguration& cfg) {
            BeastTransportOptions o;
            o.connect_timeout = cfg.connect_timeout;
            o.tls_negotiation_timeout = cfg.effective_tls_negotiation_timeout();
            o.read_timeout = cfg.read_timeout;
            o.write_timeout = cfg.write_timeout;
            o.user_agent = cfg.user_agent;
            o.max_body_bytes = cfg.max_body_bytes;
            o.tcp_keep_alive = cfg.tcp_keep_alive;
            o.verify_tls = cfg.verify_tls;
            o.proxy = cfg.proxy;
            return o;
        }
    };

    /**
     * @brief HTTP/1.1 Transport over Boost.Beast, plain TCP or TLS.
     *
     * Channels connect lazily on their first exchange and are reused while
     * the peer keeps the connection alive. Each channel runs its socket work
     * on its own strand, so abort() can interrupt an exchange from any
     * thread.
     *
     * Requests through a forward proxy use absolute-form targets for http
     * origins and a CONNECT tunnel for https origins.
     */
    class BeastTransport : public Transport,
                           public std::enable_shared_from_this<BeastTransport> {
       public:
        explicit BeastTransport(BeastTransportOptions options = {});

        bool supports(Protocol protocol) const noexcept override {
            return protocol == Protocol::Http1_1;
        }

        Result<std::shared_ptr<Channel>> open(
            const OriginKey& origin, const ProtocolLimits& limits,
            boost::asio::any_io_executor ex) override;

        boost::asio::awaitable<Result<Response>> perform_exchange(
            std::shared_ptr<Channel> channel,
            const PreparedRequest& request) override;

        void close(Channel& channel) noexcept override;

        void abort(Channel& channel) noexcept override;

        const BeastTransportOptions& options() const noexcept {
            return options_;
        }

        /// @brief Whether requests to host go through the configured proxy.
        bool uses_proxy(const std::string& host) const;

       private:
        friend class BeastChannel;

        BeastTransportOptions options_;
        boost::asio::ssl::context ssl_ctx_;
    };

}  // namespace muxpool

#include "muxpool/request_executor.hpp"

#include <exception>
#include <optional>
#include <stdexcept>

#include "muxpool/logging.hpp"
#include "muxpool/metrics.hpp"
#include "muxpool/origin.hpp"
#include "muxpool/url.hpp"

namespace muxpool {

    RequestExecutor::RequestExecutor(std::shared_ptr<PoolRegistry> registry,
                                     std::shared_ptr<Transport> transport,
                                     std::string client_name,
                                     std::chrono::milliseconds acquire_timeout)
        : registry_(std::move(registry)),
          transport_(std::move(transport)),
          client_name_(std::move(client_name)),
          acquire_timeout_(acquire_timeout) {
        if (!registry_ || !transport_) {
            throw std::invalid_argument(
                "request executor needs a pool registry and a transport");
        }
    }

    boost::asio::awaitable<Result<Response>> RequestExecutor::execute(
        ExecuteRequest req) {
        using R = Result<Response>;

        if (req.metrics) {
            try {
                req.metrics->record(metric_names::kHttpClientName,
                                    client_name_);
            } catch (const std::exception& e) {
                logger()->warn("metrics sink failed: {}", e.what());
            }
        }

        auto u_res = parse_url(req.request.url);
        if (u_res.has_error()) co_return R::err(u_res.error());
        UrlComponents u = std::move(u_res.value());

        if (!is_known(req.request.method)) {
            co_return R::err(Error::Code::Unknown, "Unknown HTTP method");
        }

        const OriginKey origin = OriginKey::from_url(u);
        auto pool_res = registry_->get(origin);
        if (pool_res.has_error()) co_return R::err(pool_res.error());
        auto pool = std::move(pool_res.value());

        auto lease_res =
            co_await pool->acquire(acquire_timeout_, req.cancellation);
        if (lease_res.has_error() &&
            lease_res.error().code == Error::Code::PoolClosed &&
            !registry_->is_closed()) {
            // Evicted between get() and acquire(); the registry replaces a
            // closed pool, so one more lookup finds a live one.
            logger()->debug("pool for {} closed under a request, retrying",
                            origin.to_string());
            pool_res = registry_->get(origin);
            if (pool_res.has_error()) co_return R::err(pool_res.error());
            pool = std::move(pool_res.value());
            lease_res =
                co_await pool->acquire(acquire_timeout_, req.cancellation);
        }
        if (lease_res.has_error()) {
            logger()->debug("acquire for {} failed: {}", origin.to_string(),
                            lease_res.error().message);
            co_return R::err(lease_res.error());
        }
        auto lease = std::move(lease_res.value());

        // An HTTP/1.1 channel carries only this exchange, so cancelling
        // aborts the channel. Multiplexed channels are shared with other
        // streams; there the transport watches preq.cancellation instead.
        auto channel = lease.channel();
        const bool exclusive_channel = lease.protocol() == Protocol::Http1_1;
        CancellationRegistration registration;
        if (exclusive_channel) {
            std::weak_ptr<Channel> weak_channel = channel;
            auto transport = transport_;
            registration =
                req.cancellation.on_cancel([weak_channel, transport] {
                    if (auto ch = weak_channel.lock()) transport->abort(*ch);
                });
        }

        PreparedRequest preq{u, &req.request, req.cancellation};
        std::optional<R> res;
        try {
            res.emplace(co_await transport_->perform_exchange(channel, preq));
        } catch (const std::exception& e) {
            logger()->error("transport threw during exchange with {}: {}",
                            origin.to_string(), e.what());
            res.emplace(R::err(Error::Code::TransportFailure, e.what()));
        }
        registration.reset();

        if (res->has_error()) {
            auto& err = res->error();
            if (req.cancellation.is_cancelled()) {
                err = Error{Error::Code::Cancelled, "request cancelled"};
            } else if (err.code == Error::Code::Cancelled &&
                       pool->state() != PoolState::Active) {
                err = Error{Error::Code::PoolClosed,
                            "request aborted by closing pool for " +
                                origin.to_string()};
            }
            if (is_transport_error(err.code) ||
                (exclusive_channel && err.code == Error::Code::Cancelled)) {
                pool->mark_degraded(lease);
            }
            logger()->debug("{} {} failed ({}): {}",
                            to_string(req.request.method), req.request.url,
                            to_string(err.code), err.message);
        }

        lease.release();
        co_return std::move(*res);
    }

}  // namespace muxpool

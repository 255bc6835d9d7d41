#include "muxpool/async_client.hpp"

#include <boost/asio/co_spawn.hpp>
#include <chrono>
#include <exception>
#include <stdexcept>

#include "muxpool/connection/connection_pool.hpp"
#include "muxpool/logging.hpp"
#include "muxpool/transport/beast_transport.hpp"

namespace muxpool {

    namespace {
        /// Extra time a blocking close() gives the pools beyond their grace
        /// period.
        constexpr std::chrono::seconds kCloseSlack{1};
    }  // namespace

    AsyncHttpClient::AsyncHttpClient(ClientConfiguration cfg,
                                     std::shared_ptr<Transport> transport)
        : cfg_(std::move(cfg)) {
        LoggerManager::init(cfg_.logging);

        if (auto st = cfg_.validate(); !st) {
            throw std::invalid_argument("Invalid client configuration: " +
                                        st.error().message);
        }

        if (!transport) {
            transport = std::make_shared<BeastTransport>(
                BeastTransportOptions::from(cfg_));
        }
        if (!transport->supports(cfg_.protocol)) {
            throw std::invalid_argument(
                std::string("Transport does not support ") +
                to_string(cfg_.protocol));
        }
        transport_ = std::move(transport);

        auto handle = EventLoopGroupHandle::acquire(cfg_.event_loop);
        if (handle.has_error()) {
            throw std::invalid_argument(handle.error().message);
        }
        handle_ =
            std::make_unique<EventLoopGroupHandle>(std::move(handle).value());

        negotiator_ = std::make_shared<ProtocolNegotiator>(
            ProtocolNegotiator::defaults_from(cfg_));
        registry_ = std::make_shared<PoolRegistry>(
            handle_->get_executor(),
            PoolRegistry::make_factory(handle_->get_executor(), transport_,
                                       negotiator_,
                                       ConnectionPool::Settings::from(cfg_)));
        executor_ = std::make_unique<RequestExecutor>(
            registry_, transport_, kClientName, cfg_.acquire_timeout);

        logger()->debug("{} client created ({} event loop, {})", kClientName,
                        to_string(handle_->ownership()),
                        to_string(cfg_.protocol));
    }

    AsyncHttpClient::~AsyncHttpClient() {
        auto st = close();
        (void)st;  // already logged
    }

    boost::asio::awaitable<Result<Response>> AsyncHttpClient::execute(
        ExecuteRequest req) {
        if (is_closed()) {
            co_return Result<Response>::err(Error::Code::PoolClosed,
                                            "client is closed");
        }
        co_return co_await executor_->execute(std::move(req));
    }

    boost::asio::awaitable<Result<Response>> AsyncHttpClient::send(
        Request request) {
        ExecuteRequest req;
        req.request = std::move(request);
        co_return co_await execute(std::move(req));
    }

    std::future<Result<Response>> AsyncHttpClient::execute_async(
        ExecuteRequest req) {
        auto promise = std::make_shared<std::promise<Result<Response>>>();
        auto fut = promise->get_future();

        // A closed client's loop may be gone; nothing would run the request.
        if (is_closed()) {
            promise->set_value(Result<Response>::err(Error::Code::PoolClosed,
                                                     "client is closed"));
            return fut;
        }

        boost::asio::co_spawn(
            handle_->get_executor(),
            [this, promise,
             req = std::move(req)]() mutable -> boost::asio::awaitable<void> {
                promise->set_value(co_await execute(std::move(req)));
            },
            [promise](std::exception_ptr e) {
                if (e) promise->set_exception(e);
            });
        return fut;
    }

    boost::asio::awaitable<Result<Response>> AsyncHttpClient::get(
        std::string url) {
        Request r{HttpMethod::Get, std::move(url), {}, std::nullopt};
        co_return co_await send(std::move(r));
    }

    boost::asio::awaitable<Result<Response>> AsyncHttpClient::post(
        std::string url, std::string body) {
        Request r{HttpMethod::Post, std::move(url), {}, std::move(body)};
        co_return co_await send(std::move(r));
    }

    void AsyncHttpClient::update_protocol_defaults(
        ProtocolNegotiator::Defaults defaults) {
        negotiator_->update(std::move(defaults));
    }

    Status AsyncHttpClient::close() noexcept {
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return Status::ok();
        }
        if (!handle_) return Status::ok();

        try {
            const auto& group = handle_->group();
            if (group->running_in_this_thread() || group->is_shutting_down()) {
                // Waiting here would block the loop the pools close on.
                const auto n = registry_->close_all_now();
                logger()->debug("closed {} pools without draining", n);
            } else {
                auto done = std::make_shared<std::promise<void>>();
                auto fut = done->get_future();
                auto registry = registry_;
                boost::asio::co_spawn(
                    handle_->get_executor(),
                    [registry]() -> boost::asio::awaitable<void> {
                        auto report = co_await registry->close_all();
                        (void)report;  // logged by the registry
                    },
                    [done](std::exception_ptr e) {
                        if (e) {
                            done->set_exception(e);
                        } else {
                            done->set_value();
                        }
                    });

                const auto bound = cfg_.pool_close_grace_period + kCloseSlack;
                if (fut.wait_for(bound) != std::future_status::ready) {
                    logger()->warn(
                        "closing pools took longer than {} ms, closing them "
                        "immediately",
                        bound.count());
                    registry_->close_all_now();
                } else {
                    fut.get();
                }
            }
        } catch (const std::exception& e) {
            logger()->error("error closing pools: {}", e.what());
            registry_->close_all_now();
        }

        return handle_->close(cfg_.shutdown);
    }

}  // namespace muxpool

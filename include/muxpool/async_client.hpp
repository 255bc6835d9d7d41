#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <future>
#include <memory>
#include <string>

#include "muxpool/config.hpp"
#include "muxpool/connection/pool_registry.hpp"
#include "muxpool/event_loop_group.hpp"
#include "muxpool/protocol_negotiator.hpp"
#include "muxpool/request.hpp"
#include "muxpool/request_executor.hpp"
#include "muxpool/response.hpp"
#include "muxpool/result.hpp"
#include "muxpool/transport/transport.hpp"

namespace muxpool {

    /**
     * @brief An asynchronous HTTP client with per-origin connection pools.
     *
     * The client wires an event-loop group, a pool registry, a protocol
     * negotiator and a request executor together and owns their lifecycle.
     * All methods are thread-safe.
     *
     * close() closes every pool, then releases the event-loop group
     * according to its ownership. A borrowed group stays usable afterwards.
     */
    class AsyncHttpClient {
       public:
        /// Name reported to metric sinks for every request.
        static constexpr const char* kClientName = "MuxPool";

        /**
         * @brief Constructs an AsyncHttpClient.
         * @param cfg Client and pool configuration.
         * @param transport Transport used by every pool; a BeastTransport
         * built from cfg when null.
         * @throws std::invalid_argument if cfg is inconsistent or the
         * transport can't speak the configured protocol.
         */
        explicit AsyncHttpClient(ClientConfiguration cfg,
                                 std::shared_ptr<Transport> transport = nullptr);

        /// @brief Closes the client if close() was not called.
        ~AsyncHttpClient();

        AsyncHttpClient(const AsyncHttpClient&) = delete;
        AsyncHttpClient& operator=(const AsyncHttpClient&) = delete;

        /**
         * @brief Execute a request.
         * @return An awaitable Result containing the Response or an Error.
         */
        boost::asio::awaitable<Result<Response>> execute(ExecuteRequest req);

        /// @brief Execute a request without metrics or cancellation.
        boost::asio::awaitable<Result<Response>> send(Request request);

        /**
         * @brief Execute a request on the client's event loop.
         * @return A future completed on a worker thread; never blocks the
         * calling thread.
         */
        std::future<Result<Response>> execute_async(ExecuteRequest req);

        boost::asio::awaitable<Result<Response>> get(std::string url);

        boost::asio::awaitable<Result<Response>> post(std::string url,
                                                      std::string body);

        /**
         * @brief Close pools, then release the event-loop group.
         *
         * Idempotent and never throws. A shutdown timeout is logged and
         * returned.
         */
        Status close() noexcept;

        bool is_closed() const noexcept {
            return closed_.load(std::memory_order_acquire);
        }

        /// @brief Change protocol defaults for pools created from now on.
        void update_protocol_defaults(ProtocolNegotiator::Defaults defaults);

        const std::string& client_name() const noexcept {
            return executor_->client_name();
        }

        [[nodiscard]] ClientConfiguration const& config() const noexcept {
            return cfg_;
        }

        boost::asio::any_io_executor get_executor() const {
            return handle_->get_executor();
        }

        EventLoopGroupHandle const& event_loop() const noexcept {
            return *handle_;
        }

        PoolRegistry& registry() noexcept { return *registry_; }

        ProtocolNegotiator& negotiator() noexcept { return *negotiator_; }

       private:
        ClientConfiguration cfg_;
        std::unique_ptr<EventLoopGroupHandle> handle_;
        std::shared_ptr<Transport> transport_;
        std::shared_ptr<ProtocolNegotiator> negotiator_;
        std::shared_ptr<PoolRegistry> registry_;
        std::unique_ptr<RequestExecutor> executor_;
        std::atomic<bool> closed_{false};
    };

}  // namespace muxpool

#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "muxpool/connection/pool_registry.hpp"
#include "muxpool/request.hpp"
#include "muxpool/response.hpp"
#include "muxpool/result.hpp"
#include "muxpool/transport/transport.hpp"

namespace muxpool {

    /**
     * @brief Runs one request: borrow a lease, drive the exchange, return
     * the lease.
     *
     * The lease is released exactly once whatever the outcome, including a
     * transport that throws and a caller that cancels mid-flight. Errors are
     * returned after the release. No retries happen here.
     */
    class RequestExecutor {
       public:
        RequestExecutor(std::shared_ptr<PoolRegistry> registry,
                        std::shared_ptr<Transport> transport,
                        std::string client_name,
                        std::chrono::milliseconds acquire_timeout);

        boost::asio::awaitable<Result<Response>> execute(ExecuteRequest req);

        const std::string& client_name() const noexcept {
            return client_name_;
        }

       private:
        std::shared_ptr<PoolRegistry> registry_;
        std::shared_ptr<Transport> transport_;
        std::string client_name_;
        std::chrono::milliseconds acquire_timeout_;
    };

}  // namespace muxpool

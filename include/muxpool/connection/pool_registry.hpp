#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "muxpool/connection/connection_pool.hpp"
#include "muxpool/origin.hpp"
#include "muxpool/protocol_negotiator.hpp"
#include "muxpool/result.hpp"
#include "muxpool/transport/transport.hpp"

namespace muxpool {

    /**
     * @brief Maps each origin to its ConnectionPool.
     *
     * Pools are created lazily on first get(). Creation happens under the
     * registry lock, so concurrent first requests for one origin create
     * exactly one pool and all of them receive it.
     *
     * SAFETY: all methods are thread-safe. Lock order is registry, then pool.
     */
    class PoolRegistry {
       public:
        using executor_type = boost::asio::any_io_executor;
        using clock_type = std::chrono::steady_clock;
        using PoolFactory =
            std::function<std::shared_ptr<ConnectionPool>(const OriginKey&)>;

        /// @brief Outcome of close_all(). Failures never stop the other
        /// pools from closing.
        struct CloseReport {
            std::size_t closed{0};
            std::vector<std::pair<OriginKey, Error>> failures;

            bool ok() const noexcept { return failures.empty(); }
        };

        PoolRegistry(executor_type ex, PoolFactory factory);

        /// @brief Factory creating pools with limits resolved by negotiator
        /// at creation time.
        static PoolFactory make_factory(
            executor_type ex, std::shared_ptr<Transport> transport,
            std::shared_ptr<ProtocolNegotiator> negotiator,
            ConnectionPool::Settings settings);

        PoolRegistry(const PoolRegistry&) = delete;
        PoolRegistry& operator=(const PoolRegistry&) = delete;

        /// @brief Pool for origin, created on first access.
        /// @return PoolClosed after close_all() started.
        Result<std::shared_ptr<ConnectionPool>> get(const OriginKey& origin);

        /// @brief Existing pool for origin, or nullptr. Never creates.
        std::shared_ptr<ConnectionPool> find(const OriginKey& origin) const;

        /// @brief Remove one pool and close it gracefully.
        boost::asio::awaitable<bool> evict(OriginKey origin);

        /// @brief Remove and close pools with no leases, no waiters and no
        /// activity for at least idle_for.
        boost::asio::awaitable<std::size_t> evict_idle(
            std::chrono::milliseconds idle_for,
            clock_type::time_point now = clock_type::now());

        /// @brief Close every pool concurrently and refuse new ones.
        boost::asio::awaitable<CloseReport> close_all();

        /// @brief Close every pool without draining. For paths that can't
        /// wait, such as close from a worker thread.
        std::size_t close_all_now() noexcept;

        std::size_t size() const;

        bool contains(const OriginKey& origin) const;

        bool is_closed() const;

        std::vector<OriginKey> origins() const;

        /// @brief Pools created over the registry's lifetime.
        std::size_t pools_created() const;

       private:
        static boost::asio::awaitable<CloseReport> close_pools(
            boost::asio::strand<executor_type> strand,
            std::vector<std::shared_ptr<ConnectionPool>> pools);

        boost::asio::strand<executor_type> strand_;
        PoolFactory factory_;

        mutable std::mutex mu_;
        std::unordered_map<OriginKey, std::shared_ptr<ConnectionPool>> pools_;
        bool closed_{false};
        std::size_t created_{0};
    };

}  // namespace muxpool

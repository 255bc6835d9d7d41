#include "muxpool/connection/pool_registry.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <exception>
#include <stdexcept>
#include <string>

#include "muxpool/logging.hpp"

namespace muxpool {

    PoolRegistry::PoolRegistry(executor_type ex, PoolFactory factory)
        : strand_(boost::asio::make_strand(std::move(ex))),
          factory_(std::move(factory)) {
        if (!factory_) {
            throw std::invalid_argument("pool registry needs a pool factory");
        }
    }

    PoolRegistry::PoolFactory PoolRegistry::make_factory(
        executor_type ex, std::shared_ptr<Transport> transport,
        std::shared_ptr<ProtocolNegotiator> negotiator,
        ConnectionPool::Settings settings) {
        return [ex = std::move(ex), transport = std::move(transport),
                negotiator = std::move(negotiator),
                settings](const OriginKey& origin) {
            return ConnectionPool::create(ex, origin, negotiator->resolve(),
                                          settings, transport);
        };
    }

    Result<std::shared_ptr<ConnectionPool>> PoolRegistry::get(
        const OriginKey& origin) {
        using R = Result<std::shared_ptr<ConnectionPool>>;

        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) {
            return R::err(Error::Code::PoolClosed,
                          "client is closed, no pool for " +
                              origin.to_string());
        }

        auto it = pools_.find(origin);
        if (it != pools_.end()) {
            if (it->second->state() == PoolState::Active) {
                return R::ok(it->second);
            }
            // Closed behind the registry's back; a fresh pool takes its slot.
            logger()->debug("replacing closed pool for {}", origin.to_string());
            pools_.erase(it);
        }

        std::shared_ptr<ConnectionPool> pool;
        try {
            pool = factory_(origin);
        } catch (const std::exception& e) {
            logger()->error("failed to create pool for {}: {}",
                            origin.to_string(), e.what());
            return R::err(Error::Code::InvalidConfiguration,
                          "failed to create pool for " + origin.to_string() +
                              ": " + e.what());
        }
        if (!pool) {
            return R::err(Error::Code::Unknown,
                          "pool factory returned no pool for " +
                              origin.to_string());
        }

        pools_.emplace(origin, pool);
        ++created_;
        return R::ok(std::move(pool));
    }

    std::shared_ptr<ConnectionPool> PoolRegistry::find(
        const OriginKey& origin) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = pools_.find(origin);
        return it == pools_.end() ? nullptr : it->second;
    }

    boost::asio::awaitable<bool> PoolRegistry::evict(OriginKey origin) {
        std::shared_ptr<ConnectionPool> pool;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = pools_.find(origin);
            if (it == pools_.end()) co_return false;
            pool = std::move(it->second);
            pools_.erase(it);
        }
        logger()->debug("evicting pool for {}", origin.to_string());
        co_await pool->close();
        co_return true;
    }

    boost::asio::awaitable<std::size_t> PoolRegistry::evict_idle(
        std::chrono::milliseconds idle_for, clock_type::time_point now) {
        std::vector<std::shared_ptr<ConnectionPool>> victims;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto it = pools_.begin(); it != pools_.end();) {
                const auto st = it->second->stats();
                if (st.active_leases == 0 && st.pending_acquires == 0 &&
                    now - st.last_activity >= idle_for) {
                    victims.push_back(std::move(it->second));
                    it = pools_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (auto& pool : victims) {
            logger()->debug("evicting idle pool for {}",
                            pool->origin().to_string());
            co_await pool->close();
        }
        co_return victims.size();
    }

    boost::asio::awaitable<PoolRegistry::CloseReport>
    PoolRegistry::close_all() {
        std::vector<std::shared_ptr<ConnectionPool>> pools;
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
            pools.reserve(pools_.size());
            for (auto& [origin, pool] : pools_) {
                (void)origin;
                pools.push_back(std::move(pool));
            }
            pools_.clear();
        }

        auto strand = strand_;
        auto on_strand = [strand, pools = std::move(pools)]() mutable
            -> boost::asio::awaitable<CloseReport> {
            co_return co_await close_pools(strand, std::move(pools));
        };
        CloseReport report = co_await boost::asio::co_spawn(
            strand_, std::move(on_strand), boost::asio::use_awaitable);

        if (report.ok()) {
            logger()->debug("closed {} pools", report.closed);
        } else {
            logger()->error("closed {} pools, {} failed to close",
                            report.closed, report.failures.size());
        }
        co_return report;
    }

    boost::asio::awaitable<PoolRegistry::CloseReport> PoolRegistry::close_pools(
        boost::asio::strand<executor_type> strand,
        std::vector<std::shared_ptr<ConnectionPool>> pools) {
        struct Join {
            explicit Join(boost::asio::strand<executor_type> s)
                : timer(s) {}
            boost::asio::steady_timer timer;
            std::size_t remaining{0};
            CloseReport report;
        };

        auto join = std::make_shared<Join>(strand);
        join->timer.expires_at(boost::asio::steady_timer::time_point::max());
        join->remaining = pools.size();

        // Completions are bound to this strand, so they run only after this
        // coroutine suspends on the timer.
        for (auto& pool : pools) {
            auto origin = pool->origin();
            boost::asio::co_spawn(
                strand,
                [pool]() -> boost::asio::awaitable<void> {
                    co_await pool->close();
                },
                boost::asio::bind_executor(
                    strand, [join, origin](std::exception_ptr e) {
                        if (e) {
                            std::string what = "unknown error";
                            try {
                                std::rethrow_exception(e);
                            } catch (const std::exception& ex) {
                                what = ex.what();
                            }
                            logger()->error("failed to close pool for {}: {}",
                                            origin.to_string(), what);
                            join->report.failures.emplace_back(
                                origin,
                                Error{Error::Code::Unknown,
                                      "failed to close pool for " +
                                          origin.to_string() + ": " + what});
                        } else {
                            ++join->report.closed;
                        }
                        if (--join->remaining == 0) join->timer.cancel();
                    }));
        }

        if (join->remaining != 0) {
            boost::system::error_code ec;
            co_await join->timer.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        co_return std::move(join->report);
    }

    std::size_t PoolRegistry::close_all_now() noexcept {
        std::vector<std::shared_ptr<ConnectionPool>> pools;
        try {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
            for (auto& [origin, pool] : pools_) {
                (void)origin;
                pools.push_back(std::move(pool));
            }
            pools_.clear();
        } catch (const std::exception& e) {
            logger()->error("failed to collect pools for close: {}", e.what());
        }
        for (auto& pool : pools) pool->close_now();
        return pools.size();
    }

    std::size_t PoolRegistry::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return pools_.size();
    }

    bool PoolRegistry::contains(const OriginKey& origin) const {
        std::lock_guard<std::mutex> lk(mu_);
        return pools_.count(origin) != 0;
    }

    bool PoolRegistry::is_closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    std::vector<OriginKey> PoolRegistry::origins() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<OriginKey> out;
        out.reserve(pools_.size());
        for (auto const& [origin, pool] : pools_) {
            (void)pool;
            out.push_back(origin);
        }
        return out;
    }

    std::size_t PoolRegistry::pools_created() const {
        std::lock_guard<std::mutex> lk(mu_);
        return created_;
    }

}  // namespace muxpool

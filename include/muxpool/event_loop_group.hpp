#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "muxpool/config.hpp"
#include "muxpool/result.hpp"

namespace muxpool {

    /**
     * @brief A set of worker threads running one io_context.
     *
     * Every pool timer, transport socket and request coroutine runs on these
     * threads. The group can be shared by several clients; who shuts it down
     * is decided by EventLoopGroupHandle, never by the group itself.
     *
     * LIFECYCLE:
     * 1. Construction starts the worker threads.
     * 2. shutdown_gracefully() drops the work guard, waits for in-flight work
     *    to drain, then force-stops the io_context. Only the first call does
     *    anything; later calls report the first call's outcome.
     * 3. Destruction performs a best-effort shutdown if none happened.
     */
    class EventLoopGroup {
       public:
        using executor_type = boost::asio::io_context::executor_type;

        explicit EventLoopGroup(EventLoopGroupOptions options = {});
        ~EventLoopGroup();

        EventLoopGroup(const EventLoopGroup&) = delete;
        EventLoopGroup& operator=(const EventLoopGroup&) = delete;

        static std::shared_ptr<EventLoopGroup> create(
            EventLoopGroupOptions options = {}) {
            return std::make_shared<EventLoopGroup>(std::move(options));
        }

        executor_type get_executor() noexcept;

        boost::asio::io_context& context() noexcept;

        std::size_t thread_count() const noexcept;

        /// @brief True once shutdown was requested.
        bool is_shutting_down() const noexcept;

        /// @brief True once every worker thread has exited.
        bool is_terminated() const;

        /// @brief True if called from one of this group's worker threads.
        bool running_in_this_thread() const noexcept;

        /**
         * @brief Stop the group within bounded time.
         * @param quiet_period Time given to in-flight work to drain on its
         * own before the io_context is force-stopped.
         * @param timeout Deadline (from the call) for the workers to exit
         * after the force stop.
         * @param outer_timeout Bound for the whole call.
         * @return ShutdownTimeout if workers were still running at the
         * outer bound; they are then detached and left to finish.
         * @note Never throws. Must not be called from a worker thread.
         */
        Status shutdown_gracefully(std::chrono::milliseconds quiet_period,
                                   std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds outer_timeout);

       private:
        /// @brief State shared with the worker threads so a detached worker
        /// never outlives what it touches.
        struct Impl {
            boost::asio::io_context ioc;
            std::optional<boost::asio::executor_work_guard<executor_type>>
                guard;
            mutable std::mutex mu;
            std::condition_variable cv;
            std::size_t running{0};
            std::vector<std::thread> threads;
            std::vector<std::thread::id> thread_ids;
            std::atomic<bool> shutting_down{false};
            std::optional<Status> shutdown_outcome;

            explicit Impl(int concurrency_hint) : ioc(concurrency_hint) {}
        };

        static void run_worker(std::shared_ptr<Impl> impl);

        std::shared_ptr<Impl> impl_;
    };

    /** @brief Who is responsible for shutting an event-loop group down. */
    enum class Ownership {
        Owned,     ///< Created for this client, shut down on client close
        Borrowed,  ///< Supplied by the caller, never shut down here
        Shared     ///< Process-wide default, shut down by its last user
    };

    inline const char* to_string(Ownership o) {
        switch (o) {
            case Ownership::Owned:
                return "owned";
            case Ownership::Borrowed:
                return "borrowed";
            case Ownership::Shared:
                return "shared";
        }
        return "unknown";
    }

    /**
     * @brief Process-wide default group, reference counted across clients.
     *
     * acquire() creates the group on first use and counts a reference;
     * release() drops one and shuts the group down when the count reaches
     * zero. A later acquire() starts a fresh group.
     */
    class SharedEventLoopGroup {
       public:
        static std::shared_ptr<EventLoopGroup> acquire();

        static Status release(const ShutdownConfiguration& timings);

        /// @brief Current number of references, for diagnostics and tests.
        static std::size_t reference_count();
    };

    /**
     * @brief An event-loop group tagged with explicit ownership.
     *
     * SAFETY: close() is idempotent and thread-safe. An owned group is shut
     * down exactly once; a borrowed group is never shut down by this class.
     */
    class EventLoopGroupHandle {
       public:
        /**
         * @brief Resolve the configured event-loop source.
         * @return InvalidConfiguration if both a group and group options are
         * configured.
         */
        static Result<EventLoopGroupHandle> acquire(
            const EventLoopConfiguration& config);

        EventLoopGroupHandle(EventLoopGroupHandle&& other) noexcept;
        EventLoopGroupHandle& operator=(EventLoopGroupHandle&& other) = delete;
        EventLoopGroupHandle(const EventLoopGroupHandle&) = delete;
        EventLoopGroupHandle& operator=(const EventLoopGroupHandle&) = delete;

        /// @brief Releases the group the same way close() does.
        ~EventLoopGroupHandle();

        const std::shared_ptr<EventLoopGroup>& group() const noexcept {
            return group_;
        }

        boost::asio::any_io_executor get_executor() const {
            return group_->get_executor();
        }

        Ownership ownership() const noexcept { return ownership_; }

        bool owned() const noexcept { return ownership_ == Ownership::Owned; }

        bool is_closed() const noexcept {
            return closed_.load(std::memory_order_acquire);
        }

        /**
         * @brief Give up this handle's claim on the group.
         *
         * Owned: graceful shutdown. Shared: drop one reference. Borrowed:
         * nothing. Only the first call acts; a shutdown timeout is logged and
         * returned, never thrown.
         */
        Status close(const ShutdownConfiguration& timings) noexcept;

       private:
        EventLoopGroupHandle(std::shared_ptr<EventLoopGroup> group,
                             Ownership ownership)
            : group_(std::move(group)), ownership_(ownership) {}

        std::shared_ptr<EventLoopGroup> group_;
        Ownership ownership_;
        std::atomic<bool> closed_{false};
    };

}  // namespace muxpool

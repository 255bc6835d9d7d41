#include "muxpool/event_loop_group.hpp"

#include <algorithm>
#include <exception>
#include <string>

#if defined(__linux__)
#include <pthread.h>
#endif

#include "muxpool/logging.hpp"

namespace muxpool {

    namespace {
        void set_current_thread_name(const std::string& name) {
#if defined(__linux__)
            // Linux limits names to 15 characters plus the terminator.
            std::string short_name = name.substr(0, 15);
            pthread_setname_np(pthread_self(), short_name.c_str());
#else
            (void)name;
#endif
        }

        std::size_t effective_thread_count(std::size_t requested) {
            if (requested != 0) return requested;
            return std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
    }  // namespace

    EventLoopGroup::EventLoopGroup(EventLoopGroupOptions options) {
        const std::size_t n = effective_thread_count(options.thread_count);
        impl_ = std::make_shared<Impl>(static_cast<int>(n));
        impl_->guard.emplace(boost::asio::make_work_guard(impl_->ioc));

        std::lock_guard<std::mutex> lk(impl_->mu);
        impl_->threads.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            std::string name =
                options.thread_name_prefix + "-" + std::to_string(i);
            ++impl_->running;
            impl_->threads.emplace_back([impl = impl_, name] {
                set_current_thread_name(name);
                run_worker(impl);
            });
            impl_->thread_ids.push_back(impl_->threads.back().get_id());
        }

        logger()->debug("event loop group started with {} worker threads", n);
    }

    EventLoopGroup::~EventLoopGroup() {
        if (!impl_->shutting_down.load(std::memory_order_acquire)) {
            ShutdownConfiguration defaults;
            auto st = shutdown_gracefully(defaults.quiet_period,
                                          defaults.timeout,
                                          defaults.outer_timeout);
            (void)st;  // already logged
        }
    }

    void EventLoopGroup::run_worker(std::shared_ptr<Impl> impl) {
        for (;;) {
            try {
                impl->ioc.run();
                break;
            } catch (const std::exception& e) {
                // A handler threw; keep serving the remaining work.
                logger()->error("event loop worker caught exception: {}",
                                e.what());
            }
        }

        std::lock_guard<std::mutex> lk(impl->mu);
        --impl->running;
        impl->cv.notify_all();
    }

    EventLoopGroup::executor_type EventLoopGroup::get_executor() noexcept {
        return impl_->ioc.get_executor();
    }

    boost::asio::io_context& EventLoopGroup::context() noexcept {
        return impl_->ioc;
    }

    std::size_t EventLoopGroup::thread_count() const noexcept {
        std::lock_guard<std::mutex> lk(impl_->mu);
        return impl_->thread_ids.size();
    }

    bool EventLoopGroup::is_shutting_down() const noexcept {
        return impl_->shutting_down.load(std::memory_order_acquire);
    }

    bool EventLoopGroup::is_terminated() const {
        std::lock_guard<std::mutex> lk(impl_->mu);
        return impl_->running == 0;
    }

    bool EventLoopGroup::running_in_this_thread() const noexcept {
        const auto self = std::this_thread::get_id();
        std::lock_guard<std::mutex> lk(impl_->mu);
        return std::find(impl_->thread_ids.begin(), impl_->thread_ids.end(),
                         self) != impl_->thread_ids.end();
    }

    Status EventLoopGroup::shutdown_gracefully(
        std::chrono::milliseconds quiet_period,
        std::chrono::milliseconds timeout,
        std::chrono::milliseconds outer_timeout) {
        using clock = std::chrono::steady_clock;
        const auto start = clock::now();
        auto& impl = *impl_;

        std::unique_lock<std::mutex> lk(impl.mu);

        if (impl.shutting_down.exchange(true, std::memory_order_acq_rel)) {
            // Another caller is (or was) shutting down; wait for its outcome.
            impl.cv.wait_until(lk, start + outer_timeout,
                               [&] { return impl.shutdown_outcome.has_value(); });
            if (impl.shutdown_outcome) return *impl.shutdown_outcome;
            return Status::err(Error::Code::ShutdownTimeout,
                               "concurrent event loop shutdown did not finish");
        }

        const auto self = std::this_thread::get_id();
        const bool on_worker =
            std::find(impl.thread_ids.begin(), impl.thread_ids.end(), self) !=
            impl.thread_ids.end();

        impl.guard.reset();

        if (on_worker) {
            // Joining ourselves is impossible: stop and let workers exit.
            impl.ioc.stop();
            for (auto& t : impl.threads) {
                if (t.joinable()) t.detach();
            }
            logger()->warn(
                "event loop group shut down from one of its own worker "
                "threads; workers detached");
            impl.shutdown_outcome = Status::ok();
            impl.cv.notify_all();
            return *impl.shutdown_outcome;
        }

        auto drained = [&] { return impl.running == 0; };

        // Phase 1: let in-flight work finish on its own.
        if (!impl.cv.wait_until(lk, start + quiet_period, drained)) {
            logger()->debug(
                "event loop group still busy after quiet period of {} ms, "
                "forcing stop",
                quiet_period.count());
            impl.ioc.stop();
        }

        // Phase 2: wait for workers to exit after the force stop.
        if (!impl.cv.wait_until(lk, start + timeout, drained)) {
            logger()->warn("event loop workers still running after {} ms",
                           timeout.count());
            impl.cv.wait_until(lk, start + outer_timeout, drained);
        }

        std::vector<std::thread> threads;
        threads.swap(impl.threads);
        const bool finished = drained();
        lk.unlock();

        if (finished) {
            for (auto& t : threads) {
                if (t.joinable()) t.join();
            }
        } else {
            for (auto& t : threads) {
                if (t.joinable()) t.detach();
            }
        }

        Status outcome =
            finished ? Status::ok()
                     : Status::err(
                           Error::Code::ShutdownTimeout,
                           "Shutting down event loop group did not complete "
                           "within " +
                               std::to_string(outer_timeout.count()) + " ms");
        if (!finished) {
            logger()->error("{}", outcome.error().message);
        } else {
            logger()->debug("event loop group shut down");
        }

        lk.lock();
        impl.shutdown_outcome = outcome;
        impl.cv.notify_all();
        return outcome;
    }

    // ---- SharedEventLoopGroup ----

    namespace {
        struct SharedGroupSlot {
            std::mutex mu;
            std::shared_ptr<EventLoopGroup> group;
            std::size_t refs{0};
        };

        SharedGroupSlot& shared_slot() {
            static SharedGroupSlot slot;
            return slot;
        }
    }  // namespace

    std::shared_ptr<EventLoopGroup> SharedEventLoopGroup::acquire() {
        auto& slot = shared_slot();
        std::lock_guard<std::mutex> lk(slot.mu);
        if (!slot.group || slot.group->is_shutting_down()) {
            EventLoopGroupOptions opts;
            opts.thread_name_prefix = "muxpool-shared";
            slot.group = EventLoopGroup::create(std::move(opts));
        }
        ++slot.refs;
        return slot.group;
    }

    Status SharedEventLoopGroup::release(const ShutdownConfiguration& timings) {
        std::shared_ptr<EventLoopGroup> to_shutdown;
        {
            auto& slot = shared_slot();
            std::lock_guard<std::mutex> lk(slot.mu);
            if (slot.refs == 0) {
                logger()->warn("shared event loop group released too often");
                return Status::ok();
            }
            if (--slot.refs == 0) to_shutdown = std::move(slot.group);
        }

        if (!to_shutdown) return Status::ok();
        return to_shutdown->shutdown_gracefully(
            timings.quiet_period, timings.timeout, timings.outer_timeout);
    }

    std::size_t SharedEventLoopGroup::reference_count() {
        auto& slot = shared_slot();
        std::lock_guard<std::mutex> lk(slot.mu);
        return slot.refs;
    }

    // ---- EventLoopGroupHandle ----

    Result<EventLoopGroupHandle> EventLoopGroupHandle::acquire(
        const EventLoopConfiguration& config) {
        if (config.group && config.options) {
            return Result<EventLoopGroupHandle>::err(
                Error::Code::InvalidConfiguration,
                "an event loop group and event loop group options can't both "
                "be configured");
        }

        if (config.group) {
            if (config.group->is_shutting_down()) {
                return Result<EventLoopGroupHandle>::err(
                    Error::Code::InvalidConfiguration,
                    "the supplied event loop group is already shut down");
            }
            return Result<EventLoopGroupHandle>::ok(
                EventLoopGroupHandle(config.group, Ownership::Borrowed));
        }

        if (config.options) {
            return Result<EventLoopGroupHandle>::ok(EventLoopGroupHandle(
                EventLoopGroup::create(*config.options), Ownership::Owned));
        }

        return Result<EventLoopGroupHandle>::ok(EventLoopGroupHandle(
            SharedEventLoopGroup::acquire(), Ownership::Shared));
    }

    EventLoopGroupHandle::EventLoopGroupHandle(
        EventLoopGroupHandle&& other) noexcept
        : group_(std::move(other.group_)),
          ownership_(other.ownership_),
          closed_(other.closed_.exchange(true, std::memory_order_acq_rel)) {}

    EventLoopGroupHandle::~EventLoopGroupHandle() {
        if (!group_) return;
        auto st = close(ShutdownConfiguration{});
        (void)st;  // already logged
    }

    Status EventLoopGroupHandle::close(
        const ShutdownConfiguration& timings) noexcept {
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return Status::ok();
        }
        if (!group_) return Status::ok();

        try {
            switch (ownership_) {
                case Ownership::Owned:
                    logger()->debug("shutting down owned event loop group");
                    return group_->shutdown_gracefully(timings.quiet_period,
                                                       timings.timeout,
                                                       timings.outer_timeout);
                case Ownership::Shared:
                    return SharedEventLoopGroup::release(timings);
                case Ownership::Borrowed:
                    logger()->debug(
                        "leaving borrowed event loop group running");
                    return Status::ok();
            }
        } catch (const std::exception& e) {
            logger()->error("Unable to shutdown event loop: {}", e.what());
            return Status::err(Error::Code::ShutdownTimeout, e.what());
        }
        return Status::ok();
    }

}  // namespace muxpool

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace muxpool {

    namespace detail {
        struct CancellationState {
            std::mutex mu;
            bool cancelled{false};
            std::uint64_t next_id{1};
            std::map<std::uint64_t, std::function<void()>> callbacks;
        };
    }  // namespace detail

    /**
     * @brief RAII registration of a cancellation callback.
     *
     * Destroying the registration unregisters the callback. A callback that
     * is already running on another thread is not waited for, so callbacks
     * must only capture shared or weak ownership of what they touch.
     */
    class CancellationRegistration {
       public:
        CancellationRegistration() = default;
        CancellationRegistration(std::weak_ptr<detail::CancellationState> st,
                                 std::uint64_t id)
            : state_(std::move(st)), id_(id) {}

        CancellationRegistration(CancellationRegistration&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_) {
            other.id_ = 0;
        }

        CancellationRegistration& operator=(
            CancellationRegistration&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }

        CancellationRegistration(CancellationRegistration const&) = delete;
        CancellationRegistration& operator=(CancellationRegistration const&) =
            delete;

        ~CancellationRegistration() { reset(); }

        void reset() noexcept;

       private:
        std::weak_ptr<detail::CancellationState> state_;
        std::uint64_t id_{0};
    };

    /**
     * @brief Observer side of a CancellationSource. Cheap to copy; a
     * default-constructed token can never be cancelled.
     */
    class CancellationToken {
       public:
        CancellationToken() = default;

        bool can_be_cancelled() const noexcept { return state_ != nullptr; }

        bool is_cancelled() const;

        /// @brief Run fn once when cancellation is requested. Runs fn
        /// immediately (on the calling thread) if already cancelled.
        [[nodiscard]] CancellationRegistration on_cancel(
            std::function<void()> fn) const;

       private:
        friend class CancellationSource;
        explicit CancellationToken(
            std::shared_ptr<detail::CancellationState> st)
            : state_(std::move(st)) {}

        std::shared_ptr<detail::CancellationState> state_;
    };

    /**
     * @brief Requests cancellation of a pending acquire or an in-flight
     * exchange. cancel() is idempotent.
     */
    class CancellationSource {
       public:
        CancellationSource()
            : state_(std::make_shared<detail::CancellationState>()) {}

        CancellationToken token() const { return CancellationToken(state_); }

        /// @brief Returns true only for the call that actually cancelled.
        bool cancel();

        bool is_cancelled() const;

       private:
        std::shared_ptr<detail::CancellationState> state_;
    };

}  // namespace muxpool

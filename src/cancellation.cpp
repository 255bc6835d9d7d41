#include "muxpool/cancellation.hpp"

#include <utility>

namespace muxpool {

    void CancellationRegistration::reset() noexcept {
        if (id_ == 0) return;
        if (auto st = state_.lock()) {
            std::lock_guard<std::mutex> lk(st->mu);
            st->callbacks.erase(id_);
        }
        state_.reset();
        id_ = 0;
    }

    bool CancellationToken::is_cancelled() const {
        if (!state_) return false;
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->cancelled;
    }

    CancellationRegistration CancellationToken::on_cancel(
        std::function<void()> fn) const {
        if (!state_ || !fn) return {};

        std::uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            if (!state_->cancelled) {
                id = state_->next_id++;
                state_->callbacks.emplace(id, std::move(fn));
            }
        }

        if (id == 0) {
            fn();
            return {};
        }
        return CancellationRegistration(state_, id);
    }

    bool CancellationSource::cancel() {
        std::map<std::uint64_t, std::function<void()>> to_run;
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            if (state_->cancelled) return false;
            state_->cancelled = true;
            to_run.swap(state_->callbacks);
        }

        // Invoke outside the lock so callbacks may register or reset freely.
        for (auto& [id, fn] : to_run) {
            (void)id;
            fn();
        }
        return true;
    }

    bool CancellationSource::is_cancelled() const {
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->cancelled;
    }

}  // namespace muxpool

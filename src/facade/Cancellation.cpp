#include "callbridge/Cancellation.hpp"

#include <vector>

namespace callbridge {

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (state_ && id_ != 0) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

bool CancellationToken::cancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> fn) const {
    if (!state_ || !fn) return CancellationRegistration();

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(fn));
            return CancellationRegistration(state_, id);
        }
    }

    fn();
    return CancellationRegistration();
}

void CancellationSource::cancel() {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        for (auto& kv : state_->callbacks) {
            to_run.push_back(std::move(kv.second));
        }
        state_->callbacks.clear();
    }

    for (auto& fn : to_run) {
        fn();
    }
}

bool CancellationSource::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

}  // namespace callbridge

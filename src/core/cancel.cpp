#include "cancel.hpp"

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

void CancelToken::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancelToken::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancelToken::sleep_for(Millis d) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (d.count() > 0) {
        state_->cv.wait_for(lock, d, [this] { return state_->cancelled; });
    }
    return !state_->cancelled;
}

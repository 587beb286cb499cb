#include "outcome_channel.h"
#include <utility>

void OutcomeChannel::push(ComparisonOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        queue_.push_back(std::move(outcome));
    }
    cv_.notify_one();
}

void OutcomeChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool OutcomeChannel::pop(ComparisonOutcome& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

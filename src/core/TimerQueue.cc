#include "spill/core/TimerQueue.hh"

#include "spill/core/Log.hh"

#include <algorithm>

namespace spill {

TimerId TimerQueue::schedule(double delay, Callback callback) {
    if (!callback) {
        SPILL_LOG_WARN("TimerQueue: ignoring empty callback");
        return kInvalidTimer;
    }

    TimerId id = nextId_++;
    double due = currentTime_ + std::max(0.0, delay);
    pending_.emplace(Key{due, id}, std::move(callback));
    dueTimes_[id] = due;
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    auto it = dueTimes_.find(id);
    if (it == dueTimes_.end()) {
        return false;
    }
    pending_.erase(Key{it->second, id});
    dueTimes_.erase(it);
    return true;
}

void TimerQueue::advance(double deltaTime) {
    if (isPaused_) {
        return;
    }

    currentTime_ += std::max(0.0, deltaTime) * timeScale_;

    // Pop one at a time: a callback may schedule or cancel other timers.
    while (!pending_.empty()) {
        auto it = pending_.begin();
        if (it->first.first > currentTime_) {
            break;
        }
        Callback callback = std::move(it->second);
        dueTimes_.erase(it->first.second);
        pending_.erase(it);
        callback();
    }
}

void TimerQueue::pause() {
    isPaused_ = true;
}

void TimerQueue::resume() {
    isPaused_ = false;
}

bool TimerQueue::isPaused() const {
    return isPaused_;
}

void TimerQueue::setTimeScale(double scale) {
    if (scale < 0.0) {
        SPILL_LOG_WARN("TimerQueue: negative time scale {} clamped to 0", scale);
        scale = 0.0;
    }
    timeScale_ = scale;
}

double TimerQueue::getTimeScale() const {
    return timeScale_;
}

double TimerQueue::getCurrentTime() const {
    return currentTime_;
}

size_t TimerQueue::pendingCount() const {
    return pending_.size();
}

void TimerQueue::clear() {
    pending_.clear();
    dueTimes_.clear();
}

} // namespace spill

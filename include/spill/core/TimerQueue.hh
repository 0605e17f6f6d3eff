#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace spill {

using TimerId = uint64_t;
constexpr TimerId kInvalidTimer = 0;

// Simulated-time scheduler for delayed callbacks (decay delays, staggered
// emissions). Time only moves through advance(), so tests drive it directly.
class TimerQueue {
  public:
    using Callback = std::function<void()>;

    TimerQueue() = default;

    // Negative delays are clamped to zero.
    TimerId schedule(double delay, Callback callback);
    bool cancel(TimerId id);

    // Moves time forward by deltaTime * timeScale and fires every due timer
    // in due-time order. Timers scheduled while firing are fired in the same
    // call once they are due, so advance(0) flushes zero-delay work.
    void advance(double deltaTime);

    void pause();
    void resume();
    bool isPaused() const;

    void setTimeScale(double scale);
    double getTimeScale() const;

    double getCurrentTime() const;
    size_t pendingCount() const;

    // Drops every pending timer without running it.
    void clear();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

  private:
    using Key = std::pair<double, TimerId>;

    double currentTime_ = 0.0;
    double timeScale_ = 1.0;
    bool isPaused_ = false;
    TimerId nextId_ = 1;

    std::map<Key, Callback> pending_;
    std::unordered_map<TimerId, double> dueTimes_;
};

} // namespace spill

// Repository: Gamecast-commentary
// Component: Realtime Wait Strategy
// Copyright (c) 2025 RetroVue

#include "gamecast/timing/IWaitStrategy.hpp"

#include <chrono>

namespace gamecast::timing {

RealtimeWaitStrategy::RealtimeWaitStrategy(std::shared_ptr<ITimeSource> time_source)
    : time_source_(std::move(time_source)) {}

bool RealtimeWaitStrategy::WaitFor(int64_t duration_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (duration_ms <= 0) {
    return !interrupted_;
  }
  cv_.wait_for(lock, std::chrono::milliseconds(duration_ms),
               [this] { return interrupted_; });
  return !interrupted_;
}

bool RealtimeWaitStrategy::WaitUntil(int64_t deadline_ms) {
  return WaitFor(deadline_ms - time_source_->NowMs());
}

void RealtimeWaitStrategy::Interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

bool RealtimeWaitStrategy::Interrupted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return interrupted_;
}

}  // namespace gamecast::timing

// Repository: Gamecast-commentary
// Component: Debouncer Implementation
// Copyright (c) 2025 RetroVue

#include "gamecast/commentary/Debouncer.hpp"

#include <stdexcept>
#include <string>

namespace gamecast::commentary {

Debouncer::Debouncer(int64_t window_ms, std::shared_ptr<timing::ITimeSource> time_source)
    : window_ms_(window_ms), time_source_(std::move(time_source)) {
  if (window_ms_ <= 0) {
    throw std::invalid_argument("Debouncer window must be positive, got " +
                                std::to_string(window_ms_));
  }
}

bool Debouncer::TryAcquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now = time_source_->NowMs();
  if (last_grant_ms_ && now - *last_grant_ms_ < window_ms_) {
    return false;
  }
  last_grant_ms_ = now;
  return true;
}

std::optional<int64_t> Debouncer::LastGrantMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_grant_ms_;
}

}  // namespace gamecast::commentary

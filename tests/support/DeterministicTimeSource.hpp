// Repository: Gamecast-commentary
// Component: Deterministic Time Source (test only)
// Purpose: Virtual millisecond clock. Advanced explicitly by tests or by
//          DeterministicWaitStrategy; never by wall-clock time.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
#define GAMECAST_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_

#include <atomic>
#include <cstdint>

#include "gamecast/timing/ITimeSource.hpp"

namespace gamecast::testing {

class DeterministicTimeSource : public timing::ITimeSource {
 public:
  explicit DeterministicTimeSource(int64_t start_ms = 0) : now_ms_(start_ms) {}

  int64_t NowMs() const override { return now_ms_.load(std::memory_order_acquire); }

  void AdvanceMs(int64_t delta_ms) {
    now_ms_.fetch_add(delta_ms, std::memory_order_acq_rel);
  }

  void SetMs(int64_t value_ms) { now_ms_.store(value_ms, std::memory_order_release); }

 private:
  std::atomic<int64_t> now_ms_;
};

}  // namespace gamecast::testing

#endif  // GAMECAST_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_

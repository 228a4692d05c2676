// Repository: Gamecast-commentary
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from timing policy in the feeder and schedulers.
//          Production: RealtimeWaitStrategy sleeps and can be interrupted.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_TIMING_IWAIT_STRATEGY_HPP_
#define GAMECAST_TIMING_IWAIT_STRATEGY_HPP_

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "gamecast/timing/ITimeSource.hpp"

namespace gamecast::timing {

// Every wait is a cancellation point. Once Interrupt() has been called, the
// pending wait returns false immediately and so does every later wait; the
// owner treats false as "stop requested" and unwinds.
class IWaitStrategy {
 public:
  virtual ~IWaitStrategy() = default;

  // Blocks for duration_ms. Returns false if interrupted.
  virtual bool WaitFor(int64_t duration_ms) = 0;

  // Blocks until the owning time source reaches deadline_ms. A deadline in
  // the past returns immediately. Returns false if interrupted.
  virtual bool WaitUntil(int64_t deadline_ms) = 0;

  virtual void Interrupt() = 0;
  virtual bool Interrupted() const = 0;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  explicit RealtimeWaitStrategy(std::shared_ptr<ITimeSource> time_source);

  bool WaitFor(int64_t duration_ms) override;
  bool WaitUntil(int64_t deadline_ms) override;
  void Interrupt() override;
  bool Interrupted() const override;

 private:
  std::shared_ptr<ITimeSource> time_source_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

// Factory used by the session to give each worker its own wait strategy, so
// stopping the feeder never cancels a commentary wait and vice versa.
using WaitStrategyFactory = std::function<std::unique_ptr<IWaitStrategy>()>;

}  // namespace gamecast::timing

#endif  // GAMECAST_TIMING_IWAIT_STRATEGY_HPP_

// Repository: Gamecast-commentary
// Component: Time Source Interface
// Purpose: Monotonic millisecond clock shared by the feeder, the schedulers
//          and the debouncer. Tests substitute DeterministicTimeSource.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_TIMING_ITIME_SOURCE_HPP_
#define GAMECAST_TIMING_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace gamecast::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  // Milliseconds on a monotonic timeline. Only differences are meaningful.
  virtual int64_t NowMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace gamecast::timing

#endif  // GAMECAST_TIMING_ITIME_SOURCE_HPP_

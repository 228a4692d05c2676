// Repository: Gamecast-commentary
// Component: Debouncer
// Purpose: Minimum-interval gate for regular commentary prompts.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_DEBOUNCER_HPP_
#define GAMECAST_COMMENTARY_DEBOUNCER_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "gamecast/timing/ITimeSource.hpp"

namespace gamecast::commentary {

// Debouncer grants at most one acquisition per window.
//
// TryAcquire() is a single check-and-set: it returns true and records "now"
// as the last grant iff no grant happened within the last window_ms (or none
// ever happened); otherwise it returns false and leaves state untouched.
// The check and the write happen under one lock, so two calls in the same
// tick can never both be granted.
class Debouncer {
 public:
  Debouncer(int64_t window_ms, std::shared_ptr<timing::ITimeSource> time_source);

  Debouncer(const Debouncer&) = delete;
  Debouncer& operator=(const Debouncer&) = delete;

  [[nodiscard]] bool TryAcquire();

  int64_t WindowMs() const { return window_ms_; }
  std::optional<int64_t> LastGrantMs() const;

 private:
  const int64_t window_ms_;
  std::shared_ptr<timing::ITimeSource> time_source_;
  mutable std::mutex mutex_;
  std::optional<int64_t> last_grant_ms_;
};

}  // namespace gamecast::commentary

#endif  // GAMECAST_COMMENTARY_DEBOUNCER_HPP_

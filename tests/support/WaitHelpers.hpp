// Repository: Gamecast-commentary
// Component: Test wait helpers (test only)
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_TESTS_SUPPORT_WAIT_HELPERS_HPP_
#define GAMECAST_TESTS_SUPPORT_WAIT_HELPERS_HPP_

#include <chrono>
#include <thread>

namespace gamecast::testing {

// Polls `predicate` on the wall clock until it holds or timeout_ms elapses.
template <typename Predicate>
bool EventuallyTrue(Predicate predicate, int timeout_ms = 5000) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return predicate();
}

}  // namespace gamecast::testing

#endif  // GAMECAST_TESTS_SUPPORT_WAIT_HELPERS_HPP_

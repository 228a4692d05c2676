// Repository: Gamecast-commentary
// Component: Debouncer Contract Tests
// Purpose: One grant per window; a denied call leaves state untouched.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gamecast/commentary/Debouncer.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace gamecast::commentary {
namespace {

using gamecast::testing::DeterministicTimeSource;

class DebouncerContractTests : public ::testing::Test {
 protected:
  static constexpr int64_t kWindowMs = 5000;

  void SetUp() override {
    clock_ = std::make_shared<DeterministicTimeSource>(1000);
    debouncer_ = std::make_unique<Debouncer>(kWindowMs, clock_);
  }

  std::shared_ptr<DeterministicTimeSource> clock_;
  std::unique_ptr<Debouncer> debouncer_;
};

TEST_F(DebouncerContractTests, FirstAcquireIsGranted) {
  EXPECT_FALSE(debouncer_->LastGrantMs().has_value());
  EXPECT_TRUE(debouncer_->TryAcquire());
  ASSERT_TRUE(debouncer_->LastGrantMs().has_value());
  EXPECT_EQ(*debouncer_->LastGrantMs(), 1000);
}

TEST_F(DebouncerContractTests, GrantDenyGrantAcrossWindow) {
  EXPECT_TRUE(debouncer_->TryAcquire());

  clock_->AdvanceMs(kWindowMs - 1);
  EXPECT_FALSE(debouncer_->TryAcquire());

  clock_->AdvanceMs(2);  // t0 + W + 1
  EXPECT_TRUE(debouncer_->TryAcquire());
}

TEST_F(DebouncerContractTests, DeniedCallDoesNotMoveTheWindow) {
  ASSERT_TRUE(debouncer_->TryAcquire());
  const int64_t first_grant = *debouncer_->LastGrantMs();

  clock_->AdvanceMs(kWindowMs / 2);
  EXPECT_FALSE(debouncer_->TryAcquire());
  EXPECT_EQ(*debouncer_->LastGrantMs(), first_grant);

  // Measured from the grant, not from the denied call.
  clock_->SetMs(first_grant + kWindowMs);
  EXPECT_TRUE(debouncer_->TryAcquire());
}

TEST_F(DebouncerContractTests, ExactlyOneGrantUnderContention) {
  std::atomic<int> granted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      for (int j = 0; j < 100; ++j) {
        if (debouncer_->TryAcquire()) {
          granted.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(granted.load(), 1);
}

TEST_F(DebouncerContractTests, NonPositiveWindowIsRejected) {
  EXPECT_THROW(Debouncer(0, clock_), std::invalid_argument);
  EXPECT_THROW(Debouncer(-5, clock_), std::invalid_argument);
}

}  // namespace
}  // namespace gamecast::commentary

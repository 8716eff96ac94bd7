// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace powledger {
namespace util {

/**
 * Mockable wall clock
 *
 * Block timestamps and the retarget window are read through GetTime() so
 * tests can pin or advance time without sleeping. When mock time is 0
 * (default) the real system clock is used.
 */

// Current Unix time in seconds (mock time if set)
int64_t GetTime();

// Set mock time (0 disables mocking). Time does not advance by itself.
void SetMockTime(int64_t time);

int64_t GetMockTime();

// "2025-10-25 14:33:09 UTC"
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore the previous value on scope exit
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace powledger

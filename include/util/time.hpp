// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace ziacoin {
namespace util {

/**
 * Mockable wall clock.
 *
 * Production code reads time through these functions so tests can pin the
 * clock with SetMockTime() or MockTimeScope. A mock time of 0 means "use the
 * real clock".
 */

// Unix time in whole seconds
int64_t GetTime();

// Unix time with sub-second precision (transaction and block timestamps)
double GetTimeSeconds();

void SetMockTime(int64_t time);
int64_t GetMockTime();

// "2025-10-25 14:33:09 UTC"
std::string FormatTime(int64_t unix_time);

class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }
  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace ziacoin

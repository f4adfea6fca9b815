// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace agentmesh {
namespace util {

/**
 * Mockable time system for testing
 *
 * Production code calls GetTimeDouble()/GetSteadyTime() instead of reading the
 * system clock directly. Tests call SetMockTime() to pin the wall clock;
 * 0 restores real time.
 */

/**
 * Current time as fractional Unix timestamp (message timestamps)
 * Returns the mock time (whole seconds) if set
 */
double GetTimeDouble();

/**
 * Current steady clock time point
 * Simulated from the mock value while mock time is active
 */
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (0 disables mocking)
void SetMockTime(int64_t time);

} // namespace util
} // namespace agentmesh

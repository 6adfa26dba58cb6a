#pragma once

#include <random>
#include <core/types.hpp>

// min(base * 2^attempt, cap), then scaled by a uniform factor in
// [1 - jitter, 1 + jitter]. attempt is zero-based.
Millis backoff_delay(int attempt, Millis base, Millis cap, double jitter, std::mt19937& rng);

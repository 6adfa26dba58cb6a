#include "backoff.hpp"
#include <algorithm>
#include <cmath>

Millis backoff_delay(int attempt, Millis base, Millis cap, double jitter, std::mt19937& rng) {
    // 2^31 already dwarfs any sane cap
    int shift = std::clamp(attempt, 0, 31);
    double raw = static_cast<double>(base.count()) * std::ldexp(1.0, shift);
    double capped = std::min(raw, static_cast<double>(cap.count()));

    if (jitter > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
        capped *= dist(rng);
    }
    return Millis(static_cast<int64_t>(std::llround(std::max(0.0, capped))));
}

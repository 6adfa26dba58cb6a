#include <gtest/gtest.h>
#include <probe/backoff.hpp>

TEST(Backoff, DoublesUpToCap) {
    std::mt19937 rng(1);
    const Millis base(500), cap(4000);
    EXPECT_EQ(backoff_delay(0, base, cap, 0.0, rng).count(), 500);
    EXPECT_EQ(backoff_delay(1, base, cap, 0.0, rng).count(), 1000);
    EXPECT_EQ(backoff_delay(2, base, cap, 0.0, rng).count(), 2000);
    EXPECT_EQ(backoff_delay(3, base, cap, 0.0, rng).count(), 4000);
    EXPECT_EQ(backoff_delay(4, base, cap, 0.0, rng).count(), 4000);
}

TEST(Backoff, LargeAttemptStaysCapped) {
    std::mt19937 rng(1);
    EXPECT_EQ(backoff_delay(1000, Millis(500), Millis(4000), 0.0, rng).count(), 4000);
    EXPECT_EQ(backoff_delay(-3, Millis(500), Millis(4000), 0.0, rng).count(), 500);
}

TEST(Backoff, JitterWithinBounds) {
    std::mt19937 rng(42);
    bool varied = false;
    int64_t first = -1;
    for (int i = 0; i < 200; i++) {
        auto d = backoff_delay(1, Millis(500), Millis(4000), 0.2, rng).count();
        EXPECT_GE(d, 800);
        EXPECT_LE(d, 1200);
        if (first < 0) first = d;
        else if (d != first) varied = true;
    }
    EXPECT_TRUE(varied);
}

TEST(Backoff, SameSeedSameSequence) {
    std::mt19937 a(7), b(7);
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(backoff_delay(i, Millis(500), Millis(4000), 0.2, a),
                  backoff_delay(i, Millis(500), Millis(4000), 0.2, b));
    }
}

// SPDX-License-Identifier: MIT
// Cycle-counter delay driven by a scripted counter.

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "hal/delay.hpp"

namespace {

using namespace glint;

// Advances by `step` on every read, like a counter sampled `step` cycles apart.
struct FakeCounter {
    static uint64_t now;
    static uint64_t step;
    static uint64_t reads;

    static uint64_t read() noexcept {
        const uint64_t v = now;
        now += step;
        ++reads;
        return v;
    }

    static void reset(uint64_t start, uint64_t s = 1) {
        now = start;
        step = s;
        reads = 0;
    }
};

uint64_t FakeCounter::now = 0;
uint64_t FakeCounter::step = 1;
uint64_t FakeCounter::reads = 0;

using FakeDelay = CycleDelay<FakeCounter>;

// Cycles the counter moved while `fn` ran.
template<typename F>
uint64_t cycles_spent(F fn) {
    const uint64_t before = FakeCounter::now;
    fn();
    return FakeCounter::now - before;
}

TEST(CycleDelayTest, ReportsFrequency) {
    FakeDelay d(160000000u);
    EXPECT_EQ(d.core_frequency_hz(), 160000000u);
}

TEST(CycleDelayTest, ElapsedIsWrappingDifference) {
    FakeCounter::reset(5, 0);
    EXPECT_EQ(FakeDelay::cycles_elapsed_since(std::numeric_limits<uint64_t>::max() - 4), 10u);

    FakeCounter::reset(1000, 0);
    EXPECT_EQ(FakeDelay::current_cycle_count(), 1000u);
    EXPECT_EQ(FakeDelay::cycles_elapsed_since(400), 600u);
}

TEST(CycleDelayTest, BusyWaitRunsPastRequestedCycles) {
    FakeCounter::reset(0);
    const uint64_t spent = cycles_spent([] { FakeDelay::busy_wait_cycles(100); });
    EXPECT_GE(spent, 101u);

    FakeCounter::reset(0, 7);
    const uint64_t coarse = cycles_spent([] { FakeDelay::busy_wait_cycles(100); });
    EXPECT_GE(coarse, 101u);
}

TEST(CycleDelayTest, BusyWaitZeroStillWaits) {
    FakeCounter::reset(0);
    EXPECT_GE(cycles_spent([] { FakeDelay::busy_wait_cycles(0); }), 1u);
}

TEST(CycleDelayTest, BusyWaitAcrossCounterWrap) {
    FakeCounter::reset(std::numeric_limits<uint64_t>::max() - 5);
    const uint64_t spent = cycles_spent([] { FakeDelay::busy_wait_cycles(50); });
    EXPECT_GE(spent, 51u);
    EXPECT_LT(FakeCounter::now, 100u);
}

TEST(CycleDelayTest, DelaysNeverShorterThanNominal) {
    FakeDelay d(1000000u);   // 1 cycle per microsecond

    FakeCounter::reset(0);
    EXPECT_GE(cycles_spent([&] { d.delay_microseconds(250); }), 250u);

    FakeCounter::reset(0);
    EXPECT_GE(cycles_spent([&] { d.delay_milliseconds(3); }), 3000u);
}

TEST(CycleDelayTest, LongerRequestWaitsLonger) {
    FakeDelay d(160000000u);

    FakeCounter::reset(0, 16);
    const uint64_t t1 = cycles_spent([&] { d.delay_microseconds(10); });
    FakeCounter::reset(0, 16);
    const uint64_t t2 = cycles_spent([&] { d.delay_microseconds(20); });

    EXPECT_GE(t1, 1600u);
    EXPECT_GE(t2, 3200u);
    EXPECT_GE(t2, t1);
}

TEST(CycleDelayTest, SubCycleRequestTruncatesToZeroButStillWaits) {
    FakeDelay d(999999u);    // 1 us -> 0.999999 cycles -> 0

    FakeCounter::reset(0);
    EXPECT_GE(cycles_spent([&] { d.delay_microseconds(1); }), 1u);
}

TEST(CycleDelayTest, ConversionDoesNotOverflowThirtyTwoBits) {
    FakeDelay d(160000000u);

    // 30 ms at 160 MHz is 4 800 000 cycles, but 30 * 160e6 = 4.8e9 does not
    // fit in 32 bits; a 32-bit product would wrap to 505 032 704 / 1000.
    constexpr uint64_t expected = 4800000u;
    constexpr uint64_t wrapped  = static_cast<uint32_t>(30u * 160000000ull) / 1000u;
    constexpr uint64_t stride   = 1000u;

    FakeCounter::reset(0, stride);
    const uint64_t spent = cycles_spent([&] { d.delay_milliseconds(30); });
    EXPECT_GE(spent, expected);
    EXPECT_LT(spent, expected + 3 * stride);   // start read + exit read + one overshoot
    EXPECT_GT(spent, wrapped + 3 * stride);
}

} // namespace

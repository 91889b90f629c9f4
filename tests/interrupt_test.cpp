// SPDX-License-Identifier: MIT
// Interrupt facet of input pins: trigger mode, sampling, mask, clear, status.

#include "glb_sim.hpp"

#include <utility>

namespace glint_test {
namespace {

class InterruptTest : public GlbSimTest {};

TEST_F(InterruptTest, TriggerEventCodes) {
    auto pin = std::move(p().pin13).into_pull_up_input();   // reg 1, bits [11:9]

    pin.set_trigger_event(Event::NegativePulse);
    EXPECT_EQ(sim().GPIO_INT_MODE_SET[1], 0u);

    pin.set_trigger_event(Event::PositivePulse);
    EXPECT_EQ(sim().GPIO_INT_MODE_SET[1], 1u << 10);

    pin.set_trigger_event(Event::NegativeLevel);
    EXPECT_EQ(sim().GPIO_INT_MODE_SET[1], 2u << 10);

    pin.set_trigger_event(Event::PositiveLevel);
    EXPECT_EQ(sim().GPIO_INT_MODE_SET[1], 3u << 10);

    EXPECT_EQ(sim().GPIO_INT_MODE_SET[0], 0u);
    EXPECT_EQ(sim().GPIO_INT_MODE_SET[2], 0u);
}

TEST_F(InterruptTest, TriggerKeepsSamplingBitAndNeighbours) {
    sim().GPIO_INT_MODE_SET[2] = 0xFFFFFFFFu;
    auto pin = std::move(p().pin22).into_floating_input();   // reg 2, bits [8:6]

    pin.set_trigger_event(Event::NegativePulse);
    EXPECT_EQ(sim().GPIO_INT_MODE_SET[2], ~(3u << 7));
}

TEST_F(InterruptTest, SamplingMode) {
    auto pin = std::move(p().pin22).into_pull_down_input();

    pin.set_sampling_asynchronous();
    EXPECT_EQ(sim().GPIO_INT_MODE_SET[2], 1u << 6);

    pin.set_trigger_event(Event::PositiveLevel);
    pin.set_sampling_synchronous();
    EXPECT_EQ(sim().GPIO_INT_MODE_SET[2], 3u << 7);
}

TEST_F(InterruptTest, MaskPreservesOtherPins) {
    sim().GPIO_INT_MASK1 = 0x007FFFFFu;

    p().pin0.enable_interrupt();
    p().pin13.enable_interrupt();
    EXPECT_EQ(sim().GPIO_INT_MASK1, 0x007FFFFFu & ~((1u << 0) | (1u << 13)));

    p().pin13.disable_interrupt();
    EXPECT_EQ(sim().GPIO_INT_MASK1, 0x007FFFFFu & ~(1u << 0));
}

TEST_F(InterruptTest, ClearLeavesBitReleasedAndOthersIntact) {
    sim().GPIO_INT_CLR1 = (1u << 2) | (1u << 20);

    p().pin8.clear_pending();
    EXPECT_EQ(sim().GPIO_INT_CLR1, (1u << 2) | (1u << 20));

    p().pin20.clear_pending();
    EXPECT_EQ(sim().GPIO_INT_CLR1, 1u << 2);
}

TEST_F(InterruptTest, PendingReadsStatusBit) {
    auto pin = std::move(p().pin8).into_pull_up_input();
    EXPECT_FALSE(pin.is_pending());

    sim().GPIO_INT_STAT1 = 1u << 8;
    EXPECT_TRUE(pin.is_pending());

    sim().GPIO_INT_STAT1 = ~(1u << 8);
    EXPECT_FALSE(pin.is_pending());
}

TEST_F(InterruptTest, IsrFormsWriteTheSameBits) {
    sim().GPIO_INT_MASK1 = 0x007FFFFFu;
    sim().GPIO_INT_CLR1  = 1u << 2;
    auto pin = std::move(p().pin11).into_pull_up_input();

    pin.enable_interrupt_from_isr();
    EXPECT_EQ(sim().GPIO_INT_MASK1, 0x007FFFFFu & ~(1u << 11));

    pin.clear_pending_from_isr();
    EXPECT_EQ(sim().GPIO_INT_CLR1, 1u << 2);

    pin.disable_interrupt_from_isr();
    EXPECT_EQ(sim().GPIO_INT_MASK1, 0x007FFFFFu);
}

TEST_F(InterruptTest, InterruptSetupTouchesNoPinConfig) {
    auto pin = std::move(p().pin8).into_pull_up_input();
    const uint32_t cfg = sim().GPIO_CFGCTL[4];

    pin.set_trigger_event(Event::NegativePulse);
    pin.set_sampling_asynchronous();
    pin.clear_pending();
    pin.enable_interrupt();

    EXPECT_EQ(sim().GPIO_CFGCTL[4], cfg);
    EXPECT_EQ(sim().GPIO_CFGCTL34, 0u);
}

} // namespace
} // namespace glint_test

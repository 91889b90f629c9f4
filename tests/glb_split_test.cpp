// SPDX-License-Identifier: MIT
// Acquisition: split() hands out reset-state handles and writes nothing.

#include "glb_sim.hpp"

#include <type_traits>
#include <utility>

namespace glint_test {
namespace {

template<typename T, uint8_t N>
constexpr bool is_reset_pin = std::is_same<T, Pin<N, Input<Floating>>>::value;

static_assert(is_reset_pin<decltype(Parts::pin0), 0>, "");
static_assert(is_reset_pin<decltype(Parts::pin1), 1>, "");
static_assert(is_reset_pin<decltype(Parts::pin2), 2>, "");
static_assert(is_reset_pin<decltype(Parts::pin3), 3>, "");
static_assert(is_reset_pin<decltype(Parts::pin4), 4>, "");
static_assert(is_reset_pin<decltype(Parts::pin5), 5>, "");
static_assert(is_reset_pin<decltype(Parts::pin6), 6>, "");
static_assert(is_reset_pin<decltype(Parts::pin7), 7>, "");
static_assert(is_reset_pin<decltype(Parts::pin8), 8>, "");
static_assert(is_reset_pin<decltype(Parts::pin9), 9>, "");
static_assert(is_reset_pin<decltype(Parts::pin10), 10>, "");
static_assert(is_reset_pin<decltype(Parts::pin11), 11>, "");
static_assert(is_reset_pin<decltype(Parts::pin12), 12>, "");
static_assert(is_reset_pin<decltype(Parts::pin13), 13>, "");
static_assert(is_reset_pin<decltype(Parts::pin14), 14>, "");
static_assert(is_reset_pin<decltype(Parts::pin15), 15>, "");
static_assert(is_reset_pin<decltype(Parts::pin16), 16>, "");
static_assert(is_reset_pin<decltype(Parts::pin17), 17>, "");
static_assert(is_reset_pin<decltype(Parts::pin18), 18>, "");
static_assert(is_reset_pin<decltype(Parts::pin19), 19>, "");
static_assert(is_reset_pin<decltype(Parts::pin20), 20>, "");
static_assert(is_reset_pin<decltype(Parts::pin21), 21>, "");
static_assert(is_reset_pin<decltype(Parts::pin22), 22>, "");

static_assert(std::is_same<decltype(Parts::uart_mux0), UartMux<0, Uart0Cts>>::value, "");
static_assert(std::is_same<decltype(Parts::uart_mux7), UartMux<7, Uart0Cts>>::value, "");
static_assert(std::is_same<decltype(Parts::clk_cfg), ClkCfg>::value, "");

class GlbSplitTest : public GlbSimTest {};

TEST_F(GlbSplitTest, SplitWritesNoRegisters) {
    fill(0xA5A5A5A5u);
    Parts parts = GlbTestAccess::steal().split();
    (void)parts;

    for (size_t i = 0; i < sizeof(GLB_Type) / sizeof(uint32_t); ++i) {
        EXPECT_EQ(word(i), 0xA5A5A5A5u) << "word " << i;
    }
}

TEST_F(GlbSplitTest, TakeAfterStealIsRefused) {
    EXPECT_FALSE(Glb::take().has_value());
    EXPECT_FALSE(Glb::take().has_value());
}

TEST_F(GlbSplitTest, PartsMoveKeepsHandlesUsable) {
    Parts moved = GlbTestAccess::steal().split();
    Parts other = std::move(moved);

    EXPECT_FALSE(moved.pin5.is_live());
    EXPECT_FALSE(moved.uart_mux3.is_live());
    EXPECT_TRUE(other.pin5.is_live());

    auto led = std::move(other.pin5).into_pull_up_output();
    led.set_high();
    EXPECT_TRUE(output_latch(5));
}

TEST_F(GlbSplitTest, IndexedAccessorsNameTheSameHandles) {
    EXPECT_EQ(&p().pin<0>(), &p().pin0);
    EXPECT_EQ(&p().pin<16>(), &p().pin16);
    EXPECT_EQ(&p().pin<22>(), &p().pin22);
    EXPECT_EQ(&p().uart_mux<0>(), &p().uart_mux0);
    EXPECT_EQ(&p().uart_mux<7>(), &p().uart_mux7);

    auto tx = std::move(p().pin<16>()).into_uart();
    (void)tx;
    EXPECT_FALSE(p().pin16.is_live());
}

using GlbDeathTest = GlbSplitTest;

TEST_F(GlbDeathTest, SplittingMovedFromTokenAsserts) {
    Glb token = GlbTestAccess::steal();
    Glb owner = std::move(token);
    (void)owner;

    EXPECT_DEATH({ Parts parts = std::move(token).split(); (void)parts; },
                 "configASSERT failed");
}

TEST_F(GlbDeathTest, SplittingTwiceAsserts) {
    Glb token = GlbTestAccess::steal();
    Parts first = std::move(token).split();
    (void)first;

    EXPECT_DEATH({ Parts parts = std::move(token).split(); (void)parts; },
                 "configASSERT failed");
}

} // namespace
} // namespace glint_test

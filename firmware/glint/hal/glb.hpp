// SPDX-License-Identifier: MIT
// Project Glint - GLB Acquisition
//
// Glb is the single ownership token for the GLB register block. split()
// consumes it and hands out one handle per pin, one per UART signal and the
// clock-configuration token. Handles never alias: each touches only its own
// fields, so owning a handle is proof that nobody else configures that pin.
//
//   auto glb = glint::Glb::take();          // empty on every call after the first
//   glint::Parts p = std::move(*glb).split();
//   auto led = std::move(p.pin5).into_pull_up_output();

#pragma once
#include <cstdint>
#include <optional>
#include <tuple>

#include "gpio.hpp"
#include "uart_mux.hpp"

namespace glint {

// Clock configuration registers (ownership only, no operations yet).
class ClkCfg {
public:
    ClkCfg(ClkCfg&&) noexcept = default;
    ClkCfg& operator=(ClkCfg&&) noexcept = default;
    ClkCfg(const ClkCfg&) = delete;
    ClkCfg& operator=(const ClkCfg&) = delete;

private:
    friend struct Parts;
    ClkCfg() noexcept {}
};

// Every handle in its reset state.
struct Parts {
    Pin<0,  Input<Floating>> pin0;
    Pin<1,  Input<Floating>> pin1;
    Pin<2,  Input<Floating>> pin2;
    Pin<3,  Input<Floating>> pin3;
    Pin<4,  Input<Floating>> pin4;
    Pin<5,  Input<Floating>> pin5;
    Pin<6,  Input<Floating>> pin6;
    Pin<7,  Input<Floating>> pin7;
    Pin<8,  Input<Floating>> pin8;
    Pin<9,  Input<Floating>> pin9;
    Pin<10, Input<Floating>> pin10;
    Pin<11, Input<Floating>> pin11;
    Pin<12, Input<Floating>> pin12;
    Pin<13, Input<Floating>> pin13;
    Pin<14, Input<Floating>> pin14;
    Pin<15, Input<Floating>> pin15;
    Pin<16, Input<Floating>> pin16;
    Pin<17, Input<Floating>> pin17;
    Pin<18, Input<Floating>> pin18;
    Pin<19, Input<Floating>> pin19;
    Pin<20, Input<Floating>> pin20;
    Pin<21, Input<Floating>> pin21;
    Pin<22, Input<Floating>> pin22;

    UartMux<0, Uart0Cts> uart_mux0;
    UartMux<1, Uart0Cts> uart_mux1;
    UartMux<2, Uart0Cts> uart_mux2;
    UartMux<3, Uart0Cts> uart_mux3;
    UartMux<4, Uart0Cts> uart_mux4;
    UartMux<5, Uart0Cts> uart_mux5;
    UartMux<6, Uart0Cts> uart_mux6;
    UartMux<7, Uart0Cts> uart_mux7;

    ClkCfg clk_cfg;

    // pin<N>() is pinN, for pins chosen by board constants.
    template<uint8_t N>
    Pin<N, Input<Floating>>& pin() noexcept {
        static_assert(N < GLB_GPIO_COUNT, "BL602 has GPIO0..GPIO22");
        return std::get<N>(std::tie(
            pin0,  pin1,  pin2,  pin3,  pin4,  pin5,  pin6,  pin7,
            pin8,  pin9,  pin10, pin11, pin12, pin13, pin14, pin15,
            pin16, pin17, pin18, pin19, pin20, pin21, pin22));
    }

    template<uint8_t SIG>
    UartMux<SIG, Uart0Cts>& uart_mux() noexcept {
        static_assert(SIG < GLB_UART_SIG_COUNT, "BL602 has UART signals 0..7");
        return std::get<SIG>(std::tie(
            uart_mux0, uart_mux1, uart_mux2, uart_mux3,
            uart_mux4, uart_mux5, uart_mux6, uart_mux7));
    }

    Parts(Parts&&) noexcept = default;
    Parts& operator=(Parts&&) noexcept = default;
    Parts(const Parts&) = delete;
    Parts& operator=(const Parts&) = delete;

private:
    friend class Glb;
    Parts() noexcept {}
};

class Glb {
public:
    // The token, the first time only. Later calls get an empty optional.
    static std::optional<Glb> take();

    // Consumes the token. Writes no registers: the handles describe the
    // hardware reset state. Splitting a moved-from token trips configASSERT.
    Parts split() &&;

    Glb(Glb&& other) noexcept : owns_(other.owns_) { other.owns_ = false; }
    Glb& operator=(Glb&& other) noexcept {
        owns_ = other.owns_;
        other.owns_ = false;
        return *this;
    }
    Glb(const Glb&) = delete;
    Glb& operator=(const Glb&) = delete;

private:
    friend struct GlbTestAccess;

    // A token regardless of earlier takes; marks the block taken. Only the
    // host test seam can reach it.
    static Glb steal();

    Glb() noexcept : owns_(true) {}

    bool owns_;
};

} // namespace glint

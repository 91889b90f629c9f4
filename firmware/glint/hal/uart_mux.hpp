// SPDX-License-Identifier: MIT
// Project Glint - BL602 UART Signal Multiplexer
//
// The GLB routes eight internal UART signals (fed by GPIO N for signal N % 8)
// to one role of UART0 or UART1. Each signal is owned by one UartMux handle
// whose ROLE type records the current route; routing consumes the handle and
// returns one with the new role. Routing a consumed handle trips configASSERT.
// Reset value of every selector is UART0 CTS.

#pragma once
#include <cstdint>
#include <type_traits>

#include "glb_regs.hpp"
#include "gpio.hpp"

namespace glint {

// ---------------------------------------------------------------------------
// Roles (type state). code is the 3-bit selector value.
// ---------------------------------------------------------------------------
struct Uart0Rts { static constexpr uint8_t code = 0; };
struct Uart0Cts { static constexpr uint8_t code = 1; };
struct Uart0Tx  { static constexpr uint8_t code = 2; };
struct Uart0Rx  { static constexpr uint8_t code = 3; };
struct Uart1Rts { static constexpr uint8_t code = 4; };
struct Uart1Cts { static constexpr uint8_t code = 5; };
struct Uart1Tx  { static constexpr uint8_t code = 6; };
struct Uart1Rx  { static constexpr uint8_t code = 7; };

template<typename ROLE> struct is_uart_role : std::false_type {};
template<> struct is_uart_role<Uart0Rts> : std::true_type {};
template<> struct is_uart_role<Uart0Cts> : std::true_type {};
template<> struct is_uart_role<Uart0Tx>  : std::true_type {};
template<> struct is_uart_role<Uart0Rx>  : std::true_type {};
template<> struct is_uart_role<Uart1Rts> : std::true_type {};
template<> struct is_uart_role<Uart1Cts> : std::true_type {};
template<> struct is_uart_role<Uart1Tx>  : std::true_type {};
template<> struct is_uart_role<Uart1Rx>  : std::true_type {};

namespace detail {

// Write `code` into signal `sig`'s selector field. Called only by UartMux.
void uart_sig_select(uint8_t sig, uint8_t code);

} // namespace detail

struct Parts;

template<uint8_t SIG, typename ROLE>
class UartMux {
    static_assert(SIG < GLB_UART_SIG_COUNT, "BL602 has UART signals 0..7");
    static_assert(is_uart_role<ROLE>::value, "ROLE must be one of Uart0Rts..Uart1Rx");

public:
    using role_type = ROLE;
    static constexpr uint8_t signal = SIG;
    static constexpr uint8_t role_code = ROLE::code;

    UartMux(UartMux&& other) noexcept : owns_(other.owns_) { other.owns_ = false; }
    UartMux& operator=(UartMux&& other) noexcept {
        if (this != &other) {
            owns_ = other.owns_;
            other.owns_ = false;
        }
        return *this;
    }
    UartMux(const UartMux&) = delete;
    UartMux& operator=(const UartMux&) = delete;

    UartMux<SIG, Uart0Rts> route_to_uart0_rts() && noexcept { return route<Uart0Rts>(); }
    UartMux<SIG, Uart0Cts> route_to_uart0_cts() && noexcept { return route<Uart0Cts>(); }
    UartMux<SIG, Uart0Tx>  route_to_uart0_tx()  && noexcept { return route<Uart0Tx>(); }
    UartMux<SIG, Uart0Rx>  route_to_uart0_rx()  && noexcept { return route<Uart0Rx>(); }
    UartMux<SIG, Uart1Rts> route_to_uart1_rts() && noexcept { return route<Uart1Rts>(); }
    UartMux<SIG, Uart1Cts> route_to_uart1_cts() && noexcept { return route<Uart1Cts>(); }
    UartMux<SIG, Uart1Tx>  route_to_uart1_tx()  && noexcept { return route<Uart1Tx>(); }
    UartMux<SIG, Uart1Rx>  route_to_uart1_rx()  && noexcept { return route<Uart1Rx>(); }

    // False once the handle has been moved from or rerouted.
    bool is_live() const noexcept { return owns_; }

private:
    friend struct Parts;
    template<uint8_t, typename> friend class UartMux;

    UartMux() noexcept : owns_(true) {}

    template<typename TO>
    UartMux<SIG, TO> route() noexcept {
        configASSERT(owns_);
        owns_ = false;
        detail::uart_sig_select(SIG, TO::code);
        return UartMux<SIG, TO>();
    }

    bool owns_;
};

// True for a pin in UART mode whose internal signal is SIG, so a UART driver
// can insist on a pin that is actually wired through the mux it owns.
template<typename PIN, uint8_t SIG>
struct is_uart_pin_for : std::false_type {};

template<uint8_t N, uint8_t SIG>
struct is_uart_pin_for<Pin<N, Uart>, SIG>
    : std::integral_constant<bool, pin_desc(N).uart_sig == SIG> {};

template<typename PIN, uint8_t SIG>
inline constexpr bool is_uart_pin_for_v = is_uart_pin_for<PIN, SIG>::value;

} // namespace glint

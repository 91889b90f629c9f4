// SPDX-License-Identifier: MIT
// Project Glint - BL602 GPIO Typestate Driver
//
// Each physical pin is owned by exactly one Pin<N, MODE> handle. MODE is a
// type that records what the pin is configured as, and only the operations
// valid for that configuration exist on the handle: reading an output pin or
// driving an input pin does not compile.
//
// A mode transition consumes the handle (it must be called on an rvalue,
// i.e. std::move(pin).into_...()) and returns a handle of the new type. The
// consumed handle is dead; using it again trips configASSERT.
//
// Transition register effects (GPIO_CFGCTLn half-word + GPIO_CFGCTL34):
//   function select, input enable, pull-up, pull-down, drive = 0, schmitt = 0
//   in one read-modify-write, then output enable = !input enable in a second,
//   separate write. Between the two writes the pin can briefly show the new
//   function with the old output-enable state.

#pragma once
#include <cstdint>
#include <type_traits>

#include "glb_regs.hpp"
#include "gpio_irq.hpp"

namespace glint {

// ---------------------------------------------------------------------------
// Mode types
// ---------------------------------------------------------------------------

// Pull state. Only meaningful for the GPIO and PWM modes; analog modes are
// not modelled so there is no way to pull an ADC/DAC pin.
struct Floating {};
struct PullUp {};
struct PullDown {};

template<typename PULL> struct Input {};
template<typename PULL> struct Output {};
template<typename PULL> struct Pwm {};

// Alternate functions
struct Uart {};
struct Spi {};
struct I2c {};

template<typename MODE> struct is_input_mode : std::false_type {};
template<typename PULL> struct is_input_mode<Input<PULL>> : std::true_type {};

template<typename MODE> struct is_output_mode : std::false_type {};
template<typename PULL> struct is_output_mode<Output<PULL>> : std::true_type {};

template<typename MODE> struct is_pwm_mode : std::false_type {};
template<typename PULL> struct is_pwm_mode<Pwm<PULL>> : std::true_type {};

template<typename MODE> inline constexpr bool is_input_mode_v  = is_input_mode<MODE>::value;
template<typename MODE> inline constexpr bool is_output_mode_v = is_output_mode<MODE>::value;
template<typename MODE> inline constexpr bool is_pwm_mode_v    = is_pwm_mode<MODE>::value;

// ---------------------------------------------------------------------------
// Per-pin descriptor
// ---------------------------------------------------------------------------

enum class SpiRole : uint8_t { Miso = 0, Mosi = 1, Ss = 2, Sclk = 3 };
enum class I2cRole : uint8_t { Scl = 0, Sda = 1 };

// Where a pin's fields live, and which peripheral signals it carries when
// switched to an alternate function.
struct PinDesc {
    uint8_t cfg_reg;     // GPIO_CFGCTL[cfg_reg]
    uint8_t cfg_shift;   // 0 or 16
    uint8_t int_reg;     // GPIO_INT_MODE_SET[int_reg]
    uint8_t int_shift;   // 3 bits per pin
    uint8_t uart_sig;    // internal UART signal fed by this pin
    SpiRole spi_role;
    I2cRole i2c_role;
};

constexpr PinDesc pin_desc(uint8_t pin) {
    return PinDesc{
        static_cast<uint8_t>(pin / GLB_CFGCTL_PINS_PER_REG),
        static_cast<uint8_t>((pin % GLB_CFGCTL_PINS_PER_REG) * GLB_CFGCTL_PIN_STRIDE),
        static_cast<uint8_t>(pin / GLB_INT_MODE_PINS_PER_REG),
        static_cast<uint8_t>((pin % GLB_INT_MODE_PINS_PER_REG) * GLB_INT_MODE_PIN_STRIDE),
        static_cast<uint8_t>(pin % GLB_UART_SIG_COUNT),
        static_cast<SpiRole>(pin % 4u),
        static_cast<I2cRole>(pin % 2u),
    };
}

// ---------------------------------------------------------------------------
// Register-level primitives (gpio.cpp). Only the typed handles below call
// these; an out-of-range pin trips configASSERT.
// ---------------------------------------------------------------------------
namespace detail {

// Full mode write: both registers, in order, not atomic as a pair.
void gpio_configure(uint8_t pin, uint8_t func, bool pull_up, bool pull_down, bool input_enable);

void gpio_set_schmitt(uint8_t pin, bool enable);

// Input level (GPIO_CFGCTL30).
bool gpio_read(uint8_t pin);

// Output latch (GPIO_CFGCTL32).
void gpio_write(uint8_t pin, bool high);
bool gpio_output_state(uint8_t pin);

// Read the latch, write back the opposite level. Two accesses.
void gpio_toggle(uint8_t pin);

} // namespace detail

struct Parts;

// ---------------------------------------------------------------------------
// Pin handle
//
// A handle that has been moved from (including by a transition) is dead:
// every member trips configASSERT on it.
// ---------------------------------------------------------------------------
template<uint8_t N, typename MODE>
class Pin {
    static_assert(N < GLB_GPIO_COUNT, "BL602 has GPIO0..GPIO22");

    template<typename M>
    using if_input = std::enable_if_t<is_input_mode_v<M>, int>;
    template<typename M>
    using if_output = std::enable_if_t<is_output_mode_v<M>, int>;

public:
    using mode_type = MODE;
    static constexpr uint8_t index = N;

    Pin(Pin&& other) noexcept : owns_(other.owns_) { other.owns_ = false; }
    Pin& operator=(Pin&& other) noexcept {
        if (this != &other) {
            owns_ = other.owns_;
            other.owns_ = false;
        }
        return *this;
    }
    Pin(const Pin&) = delete;
    Pin& operator=(const Pin&) = delete;

    // -- GPIO modes (function 11, software GPIO) -----------------------------

    // Hi-Z floating output.
    Pin<N, Output<Floating>> into_floating_output() && noexcept {
        return into_mode<Output<Floating>>(GLB_GPIO_FUNC_SWGPIO, false, false, false);
    }

    Pin<N, Output<PullUp>> into_pull_up_output() && noexcept {
        return into_mode<Output<PullUp>>(GLB_GPIO_FUNC_SWGPIO, true, false, false);
    }

    Pin<N, Output<PullDown>> into_pull_down_output() && noexcept {
        return into_mode<Output<PullDown>>(GLB_GPIO_FUNC_SWGPIO, false, true, false);
    }

    // Hi-Z floating input. This is also the reset state.
    Pin<N, Input<Floating>> into_floating_input() && noexcept {
        return into_mode<Input<Floating>>(GLB_GPIO_FUNC_SWGPIO, false, false, true);
    }

    Pin<N, Input<PullUp>> into_pull_up_input() && noexcept {
        return into_mode<Input<PullUp>>(GLB_GPIO_FUNC_SWGPIO, true, false, true);
    }

    Pin<N, Input<PullDown>> into_pull_down_input() && noexcept {
        return into_mode<Input<PullDown>>(GLB_GPIO_FUNC_SWGPIO, false, true, true);
    }

    // -- PWM (function 8, channel N % 5) --------------------------------------

    Pin<N, Pwm<PullDown>> into_pull_down_pwm() && noexcept {
        return into_mode<Pwm<PullDown>>(GLB_GPIO_FUNC_PWM, false, true, true);
    }

    Pin<N, Pwm<PullUp>> into_pull_up_pwm() && noexcept {
        return into_mode<Pwm<PullUp>>(GLB_GPIO_FUNC_PWM, true, false, true);
    }

    Pin<N, Pwm<Floating>> into_floating_pwm() && noexcept {
        return into_mode<Pwm<Floating>>(GLB_GPIO_FUNC_PWM, false, false, true);
    }

    // -- Alternate functions, always pulled up --------------------------------

    // Feeds internal UART signal uart_signal(); route it with UartMux.
    Pin<N, Uart> into_uart() && noexcept {
        return into_mode<Uart>(GLB_GPIO_FUNC_UART, true, false, true);
    }

    // Carries spi_role() of the SPI controller.
    Pin<N, Spi> into_spi() && noexcept {
        return into_mode<Spi>(GLB_GPIO_FUNC_SPI, true, false, true);
    }

    // Carries i2c_role() of the I2C controller.
    Pin<N, I2c> into_i2c() && noexcept {
        return into_mode<I2c>(GLB_GPIO_FUNC_I2C, true, false, true);
    }

    static constexpr uint8_t uart_signal() noexcept { return pin_desc(N).uart_sig; }
    static constexpr SpiRole spi_role() noexcept { return pin_desc(N).spi_role; }
    static constexpr I2cRole i2c_role() noexcept { return pin_desc(N).i2c_role; }

    // False once the handle has been moved from.
    bool is_live() const noexcept { return owns_; }

    // -- Input modes ------------------------------------------------------------

    template<typename M = MODE, if_input<M> = 0>
    bool is_high() const noexcept { check(); return detail::gpio_read(N); }

    template<typename M = MODE, if_input<M> = 0>
    bool is_low() const noexcept { check(); return !detail::gpio_read(N); }

    // Schmitt trigger input filter. Does not change the mode.
    template<typename M = MODE, if_input<M> = 0>
    void enable_input_filter() noexcept { check(); detail::gpio_set_schmitt(N, true); }

    template<typename M = MODE, if_input<M> = 0>
    void disable_input_filter() noexcept { check(); detail::gpio_set_schmitt(N, false); }

    // Interrupt configuration. Dispatch is left to the caller's ISR.
    // Task context only, except the *_from_isr forms and is_pending().
    template<typename M = MODE, if_input<M> = 0>
    void set_trigger_event(Event event) noexcept { check(); detail::gpio_int_set_trigger(N, event); }

    template<typename M = MODE, if_input<M> = 0>
    void set_sampling_asynchronous() noexcept { check(); detail::gpio_int_set_async(N, true); }

    template<typename M = MODE, if_input<M> = 0>
    void set_sampling_synchronous() noexcept { check(); detail::gpio_int_set_async(N, false); }

    template<typename M = MODE, if_input<M> = 0>
    void enable_interrupt() noexcept { check(); detail::gpio_int_set_masked(N, false); }

    template<typename M = MODE, if_input<M> = 0>
    void disable_interrupt() noexcept { check(); detail::gpio_int_set_masked(N, true); }

    template<typename M = MODE, if_input<M> = 0>
    void clear_pending() noexcept { check(); detail::gpio_int_clear(N); }

    template<typename M = MODE, if_input<M> = 0>
    void enable_interrupt_from_isr() noexcept { check(); detail::gpio_int_set_masked_from_isr(N, false); }

    template<typename M = MODE, if_input<M> = 0>
    void disable_interrupt_from_isr() noexcept { check(); detail::gpio_int_set_masked_from_isr(N, true); }

    template<typename M = MODE, if_input<M> = 0>
    void clear_pending_from_isr() noexcept { check(); detail::gpio_int_clear_from_isr(N); }

    template<typename M = MODE, if_input<M> = 0>
    bool is_pending() const noexcept { check(); return detail::gpio_int_pending(N); }

    // -- Output modes -------------------------------------------------------------

    template<typename M = MODE, if_output<M> = 0>
    void set_high() noexcept { check(); detail::gpio_write(N, true); }

    template<typename M = MODE, if_output<M> = 0>
    void set_low() noexcept { check(); detail::gpio_write(N, false); }

    template<typename M = MODE, if_output<M> = 0>
    bool is_set_high() const noexcept { check(); return detail::gpio_output_state(N); }

    template<typename M = MODE, if_output<M> = 0>
    bool is_set_low() const noexcept { check(); return !detail::gpio_output_state(N); }

    template<typename M = MODE, if_output<M> = 0>
    void toggle() noexcept { check(); detail::gpio_toggle(N); }

private:
    friend struct Parts;
    template<uint8_t, typename> friend class Pin;

    // User-provided so the handle is not an aggregate and cannot be
    // brace-initialised outside the friends above.
    Pin() noexcept : owns_(true) {}

    void check() const noexcept { configASSERT(owns_); }

    template<typename TO>
    Pin<N, TO> into_mode(uint8_t func, bool pull_up, bool pull_down, bool input_enable) noexcept {
        check();
        owns_ = false;
        detail::gpio_configure(N, func, pull_up, pull_down, input_enable);
        return Pin<N, TO>();
    }

    bool owns_;
};

} // namespace glint

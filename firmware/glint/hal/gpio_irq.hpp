// SPDX-License-Identifier: MIT
// Project Glint - BL602 GPIO Interrupt Control
// Register-level primitives behind the interrupt facet of input pins.
// Mask, status and clear registers are shared by all 23 pins; the mode
// registers by groups of ten. Every write here is a guarded read-modify-write:
// task-context guards by default, ISR-context guards for the *_from_isr forms.

#pragma once
#include <cstdint>

namespace glint {

// Trigger event, written to the pin's 2-bit trigger-mode field.
enum class Event : uint8_t {
    NegativePulse = 0,  // falling edge
    PositivePulse = 1,  // rising edge
    NegativeLevel = 2,  // while low
    PositiveLevel = 3,  // while high
};

namespace detail {

void gpio_int_set_trigger(uint8_t pin, Event event);

// async = true samples the pin without the GPIO clock (asynchronous mode).
void gpio_int_set_async(uint8_t pin, bool async);

// masked = true stops the pin from raising the GPIO interrupt.
void gpio_int_set_masked(uint8_t pin, bool masked);
void gpio_int_set_masked_from_isr(uint8_t pin, bool masked);

void gpio_int_clear(uint8_t pin);
void gpio_int_clear_from_isr(uint8_t pin);

bool gpio_int_pending(uint8_t pin);

} // namespace detail

} // namespace glint

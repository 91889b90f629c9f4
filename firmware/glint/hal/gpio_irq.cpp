// SPDX-License-Identifier: MIT
// Project Glint - BL602 GPIO Interrupt Control Implementation

#include "gpio_irq.hpp"
#include "gpio.hpp"
#include "glb_regs.hpp"
#include "critical_section.hpp"

namespace glint {
namespace detail {

namespace {

template<typename GUARD>
void set_masked(uint8_t pin, bool masked) {
    configASSERT(pin < GLB_GPIO_COUNT);
    reg_bit_write<GUARD>(glb().GPIO_INT_MASK1, pin, masked);
}

// The clear bit is level-sensitive: holding it at 1 also blocks new events,
// so pulse it and leave it released.
template<typename GUARD>
void clear(uint8_t pin) {
    configASSERT(pin < GLB_GPIO_COUNT);
    reg_bit_write<GUARD>(glb().GPIO_INT_CLR1, pin, true);
    reg_bit_write<GUARD>(glb().GPIO_INT_CLR1, pin, false);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Trigger and sampling mode (GPIO_INT_MODE_SETn)
// ---------------------------------------------------------------------------

void gpio_int_set_trigger(uint8_t pin, Event event) {
    configASSERT(pin < GLB_GPIO_COUNT);
    const PinDesc d = pin_desc(pin);
    reg_field_modify(glb().GPIO_INT_MODE_SET[d.int_reg],
                     d.int_shift + GLB_INT_TRIG_SHIFT, GLB_INT_TRIG_WIDTH,
                     static_cast<uint32_t>(event));
}

void gpio_int_set_async(uint8_t pin, bool async) {
    configASSERT(pin < GLB_GPIO_COUNT);
    const PinDesc d = pin_desc(pin);
    reg_bit_write(glb().GPIO_INT_MODE_SET[d.int_reg], d.int_shift + GLB_INT_CTRL_SHIFT, async);
}

// ---------------------------------------------------------------------------
// Mask / clear / status (shared by all pins)
// ---------------------------------------------------------------------------

void gpio_int_set_masked(uint8_t pin, bool masked) {
    set_masked<CriticalSection>(pin, masked);
}

void gpio_int_set_masked_from_isr(uint8_t pin, bool masked) {
    set_masked<CriticalSectionFromIsr>(pin, masked);
}

void gpio_int_clear(uint8_t pin) {
    clear<CriticalSection>(pin);
}

void gpio_int_clear_from_isr(uint8_t pin) {
    clear<CriticalSectionFromIsr>(pin);
}

bool gpio_int_pending(uint8_t pin) {
    configASSERT(pin < GLB_GPIO_COUNT);
    return reg_bit_read(glb().GPIO_INT_STAT1, pin);
}

} // namespace detail
} // namespace glint

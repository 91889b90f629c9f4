// SPDX-License-Identifier: MIT
// Project Glint - BL602 GPIO Driver Implementation

#include "gpio.hpp"
#include "glb_regs.hpp"

namespace glint {
namespace detail {

namespace {

volatile uint32_t& cfg_reg(uint8_t pin) {
    configASSERT(pin < GLB_GPIO_COUNT);
    return glb().GPIO_CFGCTL[pin_desc(pin).cfg_reg];
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Mode configuration
// ---------------------------------------------------------------------------

void gpio_configure(uint8_t pin, uint8_t func, bool pull_up, bool pull_down, bool input_enable) {
    volatile uint32_t& reg = cfg_reg(pin);
    const uint32_t s = pin_desc(pin).cfg_shift;

    const uint32_t mask =
        field_mask(s + GLB_CFG_FUNC_SHIFT, GLB_CFG_FUNC_WIDTH) |
        field_mask(s + GLB_CFG_IE_SHIFT, 1) |
        field_mask(s + GLB_CFG_PU_SHIFT, 1) |
        field_mask(s + GLB_CFG_PD_SHIFT, 1) |
        field_mask(s + GLB_CFG_DRV_SHIFT, GLB_CFG_DRV_WIDTH) |
        field_mask(s + GLB_CFG_SMT_SHIFT, 1);

    // Drive strength 0 and schmitt off are implied by leaving them out.
    const uint32_t bits =
        field_bits(s + GLB_CFG_FUNC_SHIFT, GLB_CFG_FUNC_WIDTH, func) |
        field_bits(s + GLB_CFG_IE_SHIFT, 1, input_enable ? 1u : 0u) |
        field_bits(s + GLB_CFG_PU_SHIFT, 1, pull_up ? 1u : 0u) |
        field_bits(s + GLB_CFG_PD_SHIFT, 1, pull_down ? 1u : 0u);

    reg_modify(reg, mask, bits);

    // Second, independent write: an input never drives, an output always does.
    reg_bit_write(glb().GPIO_CFGCTL34, pin, !input_enable);
}

void gpio_set_schmitt(uint8_t pin, bool enable) {
    volatile uint32_t& reg = cfg_reg(pin);
    reg_bit_write(reg, pin_desc(pin).cfg_shift + GLB_CFG_SMT_SHIFT, enable);
}

// ---------------------------------------------------------------------------
// GPIO read
// ---------------------------------------------------------------------------

bool gpio_read(uint8_t pin) {
    configASSERT(pin < GLB_GPIO_COUNT);
    return reg_bit_read(glb().GPIO_CFGCTL30, pin);
}

// ---------------------------------------------------------------------------
// GPIO write
// ---------------------------------------------------------------------------

void gpio_write(uint8_t pin, bool high) {
    configASSERT(pin < GLB_GPIO_COUNT);
    reg_bit_write(glb().GPIO_CFGCTL32, pin, high);
}

bool gpio_output_state(uint8_t pin) {
    configASSERT(pin < GLB_GPIO_COUNT);
    return reg_bit_read(glb().GPIO_CFGCTL32, pin);
}

// ---------------------------------------------------------------------------
// GPIO toggle
// ---------------------------------------------------------------------------

void gpio_toggle(uint8_t pin) {
    if (gpio_output_state(pin)) {
        gpio_write(pin, false);
    } else {
        gpio_write(pin, true);
    }
}

} // namespace detail
} // namespace glint

// SPDX-License-Identifier: MIT
// Project Glint - BL602 GLB Register Definitions
// Based on the BL602/BL604 Reference Manual, GLB chapter.
//
// Only the GPIO, pin-mux and UART signal-select registers are described.
// Every access to the block goes through detail::glb(); no other code forms a
// pointer into the GLB region.

#pragma once
#include <cstddef>
#include <cstdint>

#include "critical_section.hpp"

namespace glint {

// ---------------------------------------------------------------------------
// GLB - Global register block
// Base: 0x40000000
// ---------------------------------------------------------------------------
struct GLB_Type {
    uint32_t          _reserved0[48];       // 0x000-0x0BC  clock/reset control
    volatile uint32_t UART_SIG_SEL_0;       // 0x0C0  UART signal 0..7 function select
    uint32_t          _reserved1[15];
    volatile uint32_t GPIO_CFGCTL[12];      // 0x100-0x12C  Pin config, 2 pins/register
    uint32_t          _reserved2[20];
    volatile uint32_t GPIO_CFGCTL30;        // 0x180  Input level, 1 bit/pin
    volatile uint32_t GPIO_CFGCTL31;        // 0x184
    volatile uint32_t GPIO_CFGCTL32;        // 0x188  Output latch, 1 bit/pin
    volatile uint32_t GPIO_CFGCTL33;        // 0x18C
    volatile uint32_t GPIO_CFGCTL34;        // 0x190  Output enable, 1 bit/pin
    volatile uint32_t GPIO_CFGCTL35;        // 0x194
    uint32_t          _reserved3[2];
    volatile uint32_t GPIO_INT_MASK1;       // 0x1A0  1 = masked
    uint32_t          _reserved4;
    volatile uint32_t GPIO_INT_STAT1;       // 0x1A8  Pending status (read-only)
    uint32_t          _reserved5;
    volatile uint32_t GPIO_INT_CLR1;        // 0x1B0  Write 1 to clear pending
    uint32_t          _reserved6[3];
    volatile uint32_t GPIO_INT_MODE_SET[4]; // 0x1C0-0x1CC  10 pins/register, 3 bits/pin
};

static_assert(offsetof(GLB_Type, UART_SIG_SEL_0)    == 0x0C0u, "GLB layout");
static_assert(offsetof(GLB_Type, GPIO_CFGCTL)       == 0x100u, "GLB layout");
static_assert(offsetof(GLB_Type, GPIO_CFGCTL30)     == 0x180u, "GLB layout");
static_assert(offsetof(GLB_Type, GPIO_CFGCTL32)     == 0x188u, "GLB layout");
static_assert(offsetof(GLB_Type, GPIO_CFGCTL34)     == 0x190u, "GLB layout");
static_assert(offsetof(GLB_Type, GPIO_INT_MASK1)    == 0x1A0u, "GLB layout");
static_assert(offsetof(GLB_Type, GPIO_INT_STAT1)    == 0x1A8u, "GLB layout");
static_assert(offsetof(GLB_Type, GPIO_INT_CLR1)     == 0x1B0u, "GLB layout");
static_assert(offsetof(GLB_Type, GPIO_INT_MODE_SET) == 0x1C0u, "GLB layout");

static constexpr uint32_t GLB_BASE = 0x40000000u;

// Host tests retarget the block through this; nothing else can.
struct GlbTestAccess;

namespace detail {

using RegWriteObserver = void (*)(const volatile uint32_t* reg, uint32_t value);

// The one place that knows where the GLB lives.
class GlbBlock {
public:
    static GLB_Type& regs() noexcept { return *reinterpret_cast<GLB_Type*>(s_base); }

    static void notify_write(const volatile uint32_t& reg, uint32_t value) noexcept {
        if (s_observer != nullptr) {
            s_observer(&reg, value);
        }
    }

private:
    friend struct glint::GlbTestAccess;

    inline static uintptr_t        s_base     = GLB_BASE;
    inline static RegWriteObserver s_observer = nullptr;
};

inline GLB_Type& glb() noexcept { return GlbBlock::regs(); }

} // namespace detail

// ---------------------------------------------------------------------------
// GPIO_CFGCTLn: each register holds two pins, 16 bits each.
// Even pin in [15:0], odd pin in [31:16].
// ---------------------------------------------------------------------------
static constexpr uint32_t GLB_CFGCTL_PINS_PER_REG = 2;
static constexpr uint32_t GLB_CFGCTL_PIN_STRIDE   = 16;

static constexpr uint32_t GLB_CFG_IE_SHIFT    = 0;   // Input enable
static constexpr uint32_t GLB_CFG_SMT_SHIFT   = 1;   // Schmitt trigger
static constexpr uint32_t GLB_CFG_DRV_SHIFT   = 2;   // Drive strength [3:2]
static constexpr uint32_t GLB_CFG_DRV_WIDTH   = 2;
static constexpr uint32_t GLB_CFG_PU_SHIFT    = 4;   // Pull-up
static constexpr uint32_t GLB_CFG_PD_SHIFT    = 5;   // Pull-down
static constexpr uint32_t GLB_CFG_FUNC_SHIFT  = 8;   // Function select [12:8]
static constexpr uint32_t GLB_CFG_FUNC_WIDTH  = 5;

// Function select codes
static constexpr uint8_t GLB_GPIO_FUNC_SPI    = 4;
static constexpr uint8_t GLB_GPIO_FUNC_I2C    = 6;
static constexpr uint8_t GLB_GPIO_FUNC_UART   = 7;
static constexpr uint8_t GLB_GPIO_FUNC_PWM    = 8;
static constexpr uint8_t GLB_GPIO_FUNC_SWGPIO = 11;

// ---------------------------------------------------------------------------
// GPIO_INT_MODE_SETn: ten pins per register, 3 bits each.
//   bit 0      control mode (0 = synchronous, 1 = asynchronous)
//   bits [2:1] trigger mode
// ---------------------------------------------------------------------------
static constexpr uint32_t GLB_INT_MODE_PINS_PER_REG = 10;
static constexpr uint32_t GLB_INT_MODE_PIN_STRIDE   = 3;
static constexpr uint32_t GLB_INT_CTRL_SHIFT        = 0;
static constexpr uint32_t GLB_INT_TRIG_SHIFT        = 1;
static constexpr uint32_t GLB_INT_TRIG_WIDTH        = 2;

// ---------------------------------------------------------------------------
// UART_SIG_SEL_0: 4-bit selector per internal UART signal.
// ---------------------------------------------------------------------------
static constexpr uint32_t GLB_UART_SIG_STRIDE = 4;
static constexpr uint32_t GLB_UART_SIG_WIDTH  = 4;

static constexpr uint8_t GLB_GPIO_COUNT     = 23;
static constexpr uint8_t GLB_UART_SIG_COUNT = 8;

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

constexpr uint32_t field_mask(uint32_t shift, uint32_t width) {
    return ((width >= 32u) ? 0xFFFFFFFFu : ((1u << width) - 1u)) << shift;
}

constexpr uint32_t field_bits(uint32_t shift, uint32_t width, uint32_t value) {
    return (value << shift) & field_mask(shift, width);
}

namespace detail {

inline uint32_t reg_field_read(const volatile uint32_t& reg, uint32_t shift, uint32_t width) {
    return (reg & field_mask(shift, width)) >> shift;
}

// Read-modify-write of the bits in `mask`, leaving every other bit as read.
// Atomic with respect to this register only. GUARD picks task or ISR masking.
template<typename GUARD = CriticalSection>
inline void reg_modify(volatile uint32_t& reg, uint32_t mask, uint32_t bits) {
    GUARD cs;
    const uint32_t v = (reg & ~mask) | (bits & mask);
    reg = v;
    GlbBlock::notify_write(reg, v);
}

template<typename GUARD = CriticalSection>
inline void reg_field_modify(volatile uint32_t& reg, uint32_t shift, uint32_t width, uint32_t value) {
    reg_modify<GUARD>(reg, field_mask(shift, width), field_bits(shift, width, value));
}

template<typename GUARD = CriticalSection>
inline void reg_bit_write(volatile uint32_t& reg, uint32_t bit, bool set) {
    reg_modify<GUARD>(reg, 1u << bit, set ? (1u << bit) : 0u);
}

inline bool reg_bit_read(const volatile uint32_t& reg, uint32_t bit) {
    return (reg & (1u << bit)) != 0u;
}

} // namespace detail

} // namespace glint

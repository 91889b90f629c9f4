// SPDX-License-Identifier: MIT
// Project Glint - Cycle Counter Delay
//
// Busy-wait delays timed by a free-running 64-bit cycle counter. The
// provider holds only the core frequency; every call samples the counter
// afresh. Waits never return early: the cycle count is rounded down, then
// the loop runs until strictly more than that many cycles have passed.
//
// Blocks the calling context for the whole wait. Use vTaskDelay() for
// anything longer than a protocol timing gap.

#pragma once
#include <cstdint>

#include "../log/log.hpp"

namespace glint {

// COUNTER must provide `static uint64_t read()`.
template<typename COUNTER>
class CycleDelay {
public:
    // core_frequency_hz must be the clock the counter actually runs at.
    // It is not checked.
    explicit CycleDelay(uint32_t core_frequency_hz) : core_frequency_(core_frequency_hz) {
        glint_log("DELAY", "cycle delay at %lu Hz", static_cast<unsigned long>(core_frequency_hz));
    }

    uint32_t core_frequency_hz() const noexcept { return core_frequency_; }

    static uint64_t current_cycle_count() noexcept {
        return COUNTER::read();
    }

    // Modulo 2^64, so a single counter wrap since `start` is harmless.
    static uint64_t cycles_elapsed_since(uint64_t start) noexcept {
        return COUNTER::read() - start;
    }

    static void busy_wait_cycles(uint64_t cycles) noexcept {
        const uint64_t start = current_cycle_count();
        while (cycles_elapsed_since(start) <= cycles) {
        }
    }

    void delay_microseconds(uint64_t us) const noexcept {
        busy_wait_cycles((us * static_cast<uint64_t>(core_frequency_)) / 1000000u);
    }

    void delay_milliseconds(uint64_t ms) const noexcept {
        busy_wait_cycles((ms * static_cast<uint64_t>(core_frequency_)) / 1000u);
    }

private:
    uint32_t core_frequency_;
};

#if defined(__riscv)

// Machine-mode cycle counter of the current hart.
struct McycleCounter {
    static uint64_t read() noexcept {
#if __riscv_xlen == 64
        uint64_t cycles;
        __asm volatile("csrr %0, mcycle" : "=r"(cycles));
        return cycles;
#else
        // Re-read the high half until it is stable so a carry between the
        // two 32-bit reads cannot produce a torn value.
        uint32_t hi;
        uint32_t lo;
        uint32_t hi2;
        do {
            __asm volatile("csrr %0, mcycleh" : "=r"(hi));
            __asm volatile("csrr %0, mcycle"  : "=r"(lo));
            __asm volatile("csrr %0, mcycleh" : "=r"(hi2));
        } while (hi != hi2);
        return (static_cast<uint64_t>(hi) << 32) | lo;
#endif
    }
};

using McycleDelay = CycleDelay<McycleCounter>;

#endif // __riscv

} // namespace glint

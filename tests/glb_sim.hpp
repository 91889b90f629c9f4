// SPDX-License-Identifier: MIT
// Project Glint - Simulated GLB block for host tests
//
// Retargets the HAL at a zeroed in-memory GLB_Type and hands every test a
// fresh Parts from a stolen token.

#pragma once
#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <optional>

#include "glb_test_access.hpp"
#include "hal/glb.hpp"

namespace glint_test {

using namespace glint;

class GlbSimTest : public ::testing::Test {
protected:
    void SetUp() override {
        fill(0u);
        saved_ = GlbTestAccess::retarget(&sim_);
        parts_.emplace(GlbTestAccess::steal().split());
    }

    void TearDown() override {
        GlbTestAccess::observe_writes(nullptr);
        parts_.reset();
        GlbTestAccess::retarget(saved_);
    }

    Parts& p() { return *parts_; }

public:
    static GLB_Type& sim() { return sim_; }

    static void fill(uint32_t value) {
        volatile uint32_t* words = reinterpret_cast<volatile uint32_t*>(&sim_);
        for (size_t i = 0; i < sizeof(GLB_Type) / sizeof(uint32_t); ++i) {
            words[i] = value;
        }
    }

    static uint32_t word(size_t i) {
        return reinterpret_cast<const volatile uint32_t*>(&sim_)[i];
    }

    // The pin's 16-bit half of its GPIO_CFGCTLn register.
    static uint16_t cfg_half(uint8_t pin) {
        return static_cast<uint16_t>(sim_.GPIO_CFGCTL[pin / 2] >> ((pin % 2) * 16));
    }

    static bool output_enabled(uint8_t pin) {
        return (sim_.GPIO_CFGCTL34 >> pin) & 1u;
    }

    static bool output_latch(uint8_t pin) {
        return (sim_.GPIO_CFGCTL32 >> pin) & 1u;
    }

private:
    inline static GLB_Type sim_{};
    GLB_Type*            saved_ = nullptr;
    std::optional<Parts> parts_;
};

} // namespace glint_test

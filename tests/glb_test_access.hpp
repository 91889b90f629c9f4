// SPDX-License-Identifier: MIT
// Project Glint - Host test access to the GLB block
//
// The only code outside the HAL that may move the register block, observe
// register writes, or mint a second Glb token.

#pragma once
#include <cstdint>

#include "hal/glb.hpp"

namespace glint {

struct GlbTestAccess {
    // Points the HAL at `block`; returns the previous block.
    static GLB_Type* retarget(GLB_Type* block) {
        GLB_Type* prev = &detail::GlbBlock::regs();
        detail::GlbBlock::s_base = reinterpret_cast<uintptr_t>(block);
        return prev;
    }

    // Called after every guarded register write; nullptr to stop.
    static void observe_writes(detail::RegWriteObserver observer) {
        detail::GlbBlock::s_observer = observer;
    }

    static Glb steal() { return Glb::steal(); }
};

} // namespace glint

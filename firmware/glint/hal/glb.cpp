// SPDX-License-Identifier: MIT
// Project Glint - GLB Acquisition Implementation

#include "glb.hpp"
#include "critical_section.hpp"
#include "../log/log.hpp"

#include "FreeRTOS.h"

namespace glint {

namespace {

bool s_taken = false;

} // anonymous namespace

std::optional<Glb> Glb::take() {
    bool already;
    {
        CriticalSection cs;
        already = s_taken;
        s_taken = true;
    }

    if (already) {
        glint_log("GLB", "take refused: register block already owned");
        return std::nullopt;
    }
    return Glb();
}

Glb Glb::steal() {
    {
        CriticalSection cs;
        s_taken = true;
    }
    return Glb();
}

Parts Glb::split() && {
    configASSERT(owns_);
    owns_ = false;

    glint_log("GLB", "split: %u pins, %u uart signals",
              static_cast<unsigned>(GLB_GPIO_COUNT),
              static_cast<unsigned>(GLB_UART_SIG_COUNT));
    return Parts();
}

} // namespace glint

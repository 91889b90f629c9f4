// SPDX-License-Identifier: MIT
// Project Glint - BL602 UART Signal Multiplexer Implementation

#include "uart_mux.hpp"
#include "glb_regs.hpp"

namespace glint {
namespace detail {

void uart_sig_select(uint8_t sig, uint8_t code) {
    configASSERT(sig < GLB_UART_SIG_COUNT);
    reg_field_modify(glb().UART_SIG_SEL_0,
                     static_cast<uint32_t>(sig) * GLB_UART_SIG_STRIDE, GLB_UART_SIG_WIDTH,
                     code & 0x07u);
}

} // namespace detail
} // namespace glint

// SPDX-License-Identifier: MIT
// Project Glint - BL602 UART0 Debug Transmit Driver Implementation
//
// Bit period:
//   UART_BIT_PRD[15:0] = UART_CLK / baud - 1   (TX)
//   UART_BIT_PRD[31:16] = same for RX

#include "uart.hpp"

namespace glint {

namespace uart0 {
    static constexpr uint32_t BASE              = 0x4000A000u;
    static constexpr uint32_t UTX_CONFIG        = 0x00u;
    static constexpr uint32_t URX_CONFIG        = 0x04u;
    static constexpr uint32_t BIT_PRD           = 0x08u;
    static constexpr uint32_t FIFO_CONFIG_0     = 0x80u;
    static constexpr uint32_t FIFO_CONFIG_1     = 0x84u;
    static constexpr uint32_t FIFO_WDATA        = 0x88u;

    static constexpr uint32_t UTX_EN            = (1u << 0);
    static constexpr uint32_t UTX_FRM_EN        = (1u << 2);   // free-run, no length
    static constexpr uint32_t UTX_BIT_CNT_D_8   = (7u << 8);   // data bits - 1
    static constexpr uint32_t UTX_BIT_CNT_P_1   = (1u << 11);  // 1 stop bit
    static constexpr uint32_t FIFO_TX_CLR       = (1u << 2);
    static constexpr uint32_t TX_FIFO_CNT_MASK  = 0x3Fu;       // free TX entries

    inline volatile uint32_t& reg(uint32_t offset) {
        return *reinterpret_cast<volatile uint32_t*>(BASE + offset);
    }
} // namespace uart0

// ---------------------------------------------------------------------------
// uart_init
// ---------------------------------------------------------------------------
void uart_init(uint32_t uart_clk_hz, uint32_t baud) {
    uart0::reg(uart0::UTX_CONFIG) = 0;
    uart0::reg(uart0::URX_CONFIG) = 0;

    uint32_t prd = (uart_clk_hz + baud / 2u) / baud;
    if (prd == 0u) prd = 1u;
    prd = (prd - 1u) & 0xFFFFu;
    uart0::reg(uart0::BIT_PRD) = (prd << 16) | prd;

    uart0::reg(uart0::FIFO_CONFIG_0) |= uart0::FIFO_TX_CLR;

    uart0::reg(uart0::UTX_CONFIG) =
        uart0::UTX_EN | uart0::UTX_FRM_EN | uart0::UTX_BIT_CNT_D_8 | uart0::UTX_BIT_CNT_P_1;
}

// ---------------------------------------------------------------------------
// uart_putc
// ---------------------------------------------------------------------------
void uart_putc(char c) {
    while ((uart0::reg(uart0::FIFO_CONFIG_1) & uart0::TX_FIFO_CNT_MASK) == 0u) {}
    uart0::reg(uart0::FIFO_WDATA) = static_cast<uint8_t>(c);
}

void uart_write(const char* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        if (data[i] == '\n') uart_putc('\r');
        uart_putc(data[i]);
    }
}

} // namespace glint

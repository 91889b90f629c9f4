// SPDX-License-Identifier: MIT
// Project Glint - BL602 UART0 Debug Transmit Driver
//
// Blocking transmit only, 8N1, free-run framing. The TX pin and UART signal
// must already be routed (Pin::into_uart() + UartMux::route_to_uart0_tx()).

#pragma once
#include <cstddef>
#include <cstdint>

namespace glint {

// Configure UART0 for 8N1 at `baud` from a `uart_clk_hz` peripheral clock.
void uart_init(uint32_t uart_clk_hz, uint32_t baud);

// Transmit one byte (blocks until the TX FIFO has room).
void uart_putc(char c);

void uart_write(const char* data, size_t len);

} // namespace glint

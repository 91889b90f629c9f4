// SPDX-License-Identifier: MIT
// Project Glint - PineCone BL602 Board Pin Assignments
//
// Pin assignments verified against the PineCone BL602 evaluation board
// schematic (v1.1). The RGB LED is active-low.
//
// UART signal routing: GPIO N always feeds internal UART signal N % 8, so the
// debug console needs signal 0 (GPIO16) -> UART0 TX and
// signal 7 (GPIO7) -> UART0 RX.

#pragma once
#include <cstdint>

// ===========================================================================
// Debug UART (USB-serial bridge)
// ===========================================================================
static constexpr uint8_t DEBUG_UART_TX_PIN  = 16;
static constexpr uint8_t DEBUG_UART_RX_PIN  = 7;
static constexpr uint8_t DEBUG_UART_TX_SIG  = DEBUG_UART_TX_PIN % 8;   // 0
static constexpr uint8_t DEBUG_UART_RX_SIG  = DEBUG_UART_RX_PIN % 8;   // 7

// ===========================================================================
// RGB LED (active-low)
// ===========================================================================
static constexpr uint8_t LED_BLUE_PIN       = 11;
static constexpr uint8_t LED_GREEN_PIN      = 14;
static constexpr uint8_t LED_RED_PIN        = 17;

// ===========================================================================
// User input: IO8 boot jumper, sampled as a button after boot
// ===========================================================================
static constexpr uint8_t BUTTON_PIN         = 8;

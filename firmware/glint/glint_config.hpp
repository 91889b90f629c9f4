// SPDX-License-Identifier: MIT
// Project Glint - Build-time Configuration
// Every value can be overridden from the build with -D<NAME>=<value>.

#pragma once
#include <cstdint>

// ---------------------------------------------------------------------------
// Clocks
// ---------------------------------------------------------------------------

// Core clock the CPU runs at after boot ROM hand-off (PLL 160 MHz).
// The delay provider trusts this value; a wrong value scales every delay.
#ifndef GLINT_CORE_CLOCK_HZ
#define GLINT_CORE_CLOCK_HZ 160000000UL
#endif

// UART peripheral clock (UART_CLK from the 160 MHz PLL tap).
#ifndef GLINT_UART_CLOCK_HZ
#define GLINT_UART_CLOCK_HZ 160000000UL
#endif

#ifndef GLINT_DEBUG_BAUD
#define GLINT_DEBUG_BAUD 2000000UL
#endif

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

#ifndef GLINT_LOG_RING_SIZE
#define GLINT_LOG_RING_SIZE 512
#endif

#ifndef GLINT_LOG_MAX_MSG_LEN
#define GLINT_LOG_MAX_MSG_LEN 128
#endif

// How often log_task() drains the ring buffer.
#ifndef GLINT_LOG_DRAIN_PERIOD_MS
#define GLINT_LOG_DRAIN_PERIOD_MS 20
#endif

static constexpr uint32_t CORE_CLOCK_HZ  = GLINT_CORE_CLOCK_HZ;
static constexpr uint32_t UART_CLOCK_HZ  = GLINT_UART_CLOCK_HZ;
static constexpr uint32_t DEBUG_BAUD     = GLINT_DEBUG_BAUD;

/*
 * Project Glint - FreeRTOS Run-Time Stats Counter and Assert Hook
 *
 * Implements the hooks required by FreeRTOSConfig.h on the BL602 target:
 *
 *   portCONFIGURE_TIMER_FOR_RUN_TIME_STATS()  -> glint_init_runtime_counter()
 *   portGET_RUN_TIME_COUNTER_VALUE()           -> glint_get_runtime_counter()
 *   configASSERT()                             -> vAssertCalled()
 *
 * The counter is the machine-mode mcycle CSR, which increments on every core
 * clock. At 160 MHz the low 32 bits roll over every ~27 seconds; FreeRTOS
 * run-time stats only need relative deltas.
 */

#include "FreeRTOS.h"
#include "task.h"

#include "../hal/delay.hpp"
#include "../log/log.hpp"

// ---------------------------------------------------------------------------
// glint_init_runtime_counter
//
// mcycle runs from reset unless inhibited; clear mcountinhibit.CY so it is
// counting before the scheduler samples it.
// ---------------------------------------------------------------------------
extern "C" void glint_init_runtime_counter(void)
{
    __asm volatile("csrci mcountinhibit, 0x1");
}

extern "C" uint32_t glint_get_runtime_counter(void)
{
    return static_cast<uint32_t>(glint::McycleCounter::read());
}

// ---------------------------------------------------------------------------
// vAssertCalled
//
// Logs the location, then stops with interrupts off so a debugger can
// attach. The log line only reaches the UART if log_task is still running.
// ---------------------------------------------------------------------------
extern "C" void vAssertCalled(const char* file, int line)
{
    glint_log("ASSERT", "%s:%d", file, line);
    taskDISABLE_INTERRUPTS();
    for (;;) {
    }
}

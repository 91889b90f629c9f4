#pragma once

// ============================================================
// Project Glint - FreeRTOS Configuration
// Target: BL602 RV32IMAFC @ 160MHz  (port GCC/RISC-V)
// Host:   unit tests on the GCC/Posix port
// ============================================================

#include <stdint.h>

// Scheduler
#define configUSE_PREEMPTION                    1
#define configUSE_TIME_SLICING                  1
#define configUSE_IDLE_HOOK                     0
#define configUSE_TICK_HOOK                     0
#define configUSE_TICKLESS_IDLE                 0
#define configCPU_CLOCK_HZ                      160000000UL
#define configTICK_RATE_HZ                      1000U       // 1ms resolution
#define configMAX_PRIORITIES                    8
#define configMINIMAL_STACK_SIZE                256         // Idle task (words)
#define configMAX_TASK_NAME_LEN                 16
#define configUSE_16_BIT_TICKS                  0           // 32-bit tick counter
#define configUSE_PORT_OPTIMISED_TASK_SELECTION 0

// Memory
#define configTOTAL_HEAP_SIZE                   (32 * 1024)
#define configSUPPORT_DYNAMIC_ALLOCATION        1
#define configSUPPORT_STATIC_ALLOCATION         0
#define configAPPLICATION_ALLOCATED_HEAP        0

// Features
#define configUSE_MUTEXES                       1
#define configUSE_RECURSIVE_MUTEXES             0
#define configUSE_COUNTING_SEMAPHORES           0
#define configUSE_TASK_NOTIFICATIONS            1
#define configQUEUE_REGISTRY_SIZE               0
#define configUSE_QUEUE_SETS                    0
#define configUSE_TIMERS                        0

// Debugging
#define configUSE_TRACE_FACILITY                1
#define configUSE_STATS_FORMATTING_FUNCTIONS    0
#define configCHECK_FOR_STACK_OVERFLOW          0
#define configUSE_MALLOC_FAILED_HOOK            0

// Co-routines (not used)
#define configUSE_CO_ROUTINES                   0
#define configMAX_CO_ROUTINE_PRIORITIES         2

// Assertion hook: firmware halts, host tests abort.
#ifdef __cplusplus
extern "C" {
#endif
void vAssertCalled(const char* file, int line);
#ifdef __cplusplus
}
#endif
#define configASSERT(x) do { if (!(x)) { vAssertCalled(__FILE__, __LINE__); } } while (0)

// Required API includes
#define INCLUDE_vTaskPrioritySet                0
#define INCLUDE_uxTaskPriorityGet               0
#define INCLUDE_vTaskDelete                     1
#define INCLUDE_vTaskSuspend                    1
#define INCLUDE_vTaskDelayUntil                 1
#define INCLUDE_vTaskDelay                      1
#define INCLUDE_xTaskGetCurrentTaskHandle       1
#define INCLUDE_xTaskGetSchedulerState          1
#define INCLUDE_uxTaskGetStackHighWaterMark     1

#if defined(__riscv)

// Machine timer of the BL602 CLIC
#define configMTIME_BASE_ADDRESS                (0x0200BFF8UL)
#define configMTIMECMP_BASE_ADDRESS             (0x02004000UL)
#define configISR_STACK_SIZE_WORDS              512

// Run-time stats from the mcycle counter (glint_runtime.cpp)
#define configGENERATE_RUN_TIME_STATS           1
#define portCONFIGURE_TIMER_FOR_RUN_TIME_STATS()    glint_init_runtime_counter()
#define portGET_RUN_TIME_COUNTER_VALUE()             glint_get_runtime_counter()

#ifdef __cplusplus
extern "C" {
#endif
void glint_init_runtime_counter(void);
uint32_t glint_get_runtime_counter(void);
#ifdef __cplusplus
}
#endif

#else

#define configGENERATE_RUN_TIME_STATS           0

#endif

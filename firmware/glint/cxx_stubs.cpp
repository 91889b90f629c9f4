// SPDX-License-Identifier: MIT
// C++ runtime hooks for -fno-exceptions firmware: route the global allocator
// to the FreeRTOS heap so every allocation shows up in xPortGetFreeHeapSize().

#include <cstddef>

#include "FreeRTOS.h"

void* operator new(std::size_t size) {
    void* p = pvPortMalloc(size);
    configASSERT(p != nullptr);
    return p;
}

void* operator new[](std::size_t size) {
    return operator new(size);
}

void operator delete(void* p) noexcept { vPortFree(p); }
void operator delete[](void* p) noexcept { vPortFree(p); }
void operator delete(void* p, std::size_t) noexcept { vPortFree(p); }
void operator delete[](void* p, std::size_t) noexcept { vPortFree(p); }

extern "C" void __cxa_pure_virtual() { configASSERT(false); for (;;); }

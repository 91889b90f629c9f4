// SPDX-License-Identifier: MIT
// Project Glint - Scoped Critical Sections
//
// CriticalSection masks interrupts and preemption for the lifetime of the
// guard using the FreeRTOS port's nesting critical section. Task context only:
// leaving it re-enables interrupts once the task's nesting count drops to 0.
//
// CriticalSectionFromIsr is the interrupt-context form. It saves the mask
// state on entry and restores exactly that state on exit.

#pragma once

#include "FreeRTOS.h"
#include "task.h"

namespace glint {

class CriticalSection {
public:
    CriticalSection() { taskENTER_CRITICAL(); }
    ~CriticalSection() { taskEXIT_CRITICAL(); }

    CriticalSection(const CriticalSection&) = delete;
    CriticalSection& operator=(const CriticalSection&) = delete;
};

class CriticalSectionFromIsr {
public:
    CriticalSectionFromIsr() : saved_(taskENTER_CRITICAL_FROM_ISR()) {}
    ~CriticalSectionFromIsr() { taskEXIT_CRITICAL_FROM_ISR(saved_); }

    CriticalSectionFromIsr(const CriticalSectionFromIsr&) = delete;
    CriticalSectionFromIsr& operator=(const CriticalSectionFromIsr&) = delete;

private:
    UBaseType_t saved_;
};

} // namespace glint

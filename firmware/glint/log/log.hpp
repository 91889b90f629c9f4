// SPDX-License-Identifier: MIT
// Project Glint - Tagged Debug Logger
//
//   glint_log("GLB", "split: %u pins", n);
//
// Lines are formatted as  [%5ums][%-12s] <message>\n  into a ring buffer and
// written out later by whoever drains it (log_task() in firmware). Logging
// never blocks for more than a few ticks; when the ring is full the oldest
// bytes are dropped.

#pragma once
#include <cstddef>
#include <cstdint>

namespace glint {

// Receives drained log text. Not NUL-terminated.
using LogSink = void (*)(const char* data, size_t len);

// Create the ring-buffer mutex. Safe to call more than once.
// Returns false if the mutex could not be allocated.
bool log_init();

// Move everything buffered to `sink`. Returns the number of bytes written.
size_t log_drain(LogSink sink);

// Bytes currently buffered.
size_t log_pending();

// FreeRTOS task entry. `params` is the LogSink to drain into.
void log_task(void* params);

} // namespace glint

extern "C" void glint_log(const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

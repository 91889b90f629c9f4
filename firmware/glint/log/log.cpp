// SPDX-License-Identifier: MIT
// Project Glint - Tagged Debug Logger
//
// A LogRing owns the byte buffer and the FreeRTOS mutex that guards it. Lines
// are formatted on the caller's stack and appended whole; the drain side copies
// out in chunks with the mutex held only per chunk, so a slow sink never stalls
// writers. Nothing allocates after log_init().

#include "log.hpp"
#include "../glint_config.hpp"

#include "FreeRTOS.h"
#include "task.h"
#include "semphr.h"

#include <cstdarg>
#include <cstdio>
#include <cinttypes>
#include <cstring>

namespace glint {

namespace {

static constexpr size_t DRAIN_CHUNK = 64;
static constexpr TickType_t LOCK_WAIT = pdMS_TO_TICKS(5);

class LogRing {
public:
    bool init() {
        if (mutex_ == nullptr) {
            mutex_ = xSemaphoreCreateMutex();
        }
        return mutex_ != nullptr;
    }

    // Appends a whole line, discarding the oldest bytes to make room. The
    // line is dropped if the mutex is busy.
    void append(const char* src, size_t len) {
        if (len == 0 || len > SIZE) return;

        Lock lock(mutex_);
        if (!lock.held()) return;

        const size_t overflow = (size_ + len > SIZE) ? size_ + len - SIZE : 0;
        start_ = (start_ + overflow) % SIZE;
        size_ -= overflow;

        const size_t head  = (start_ + size_) % SIZE;
        const size_t first = (len < SIZE - head) ? len : SIZE - head;
        memcpy(&buf_[head], src, first);
        memcpy(&buf_[0], src + first, len - first);
        size_ += len;
    }

    // Removes up to `max` of the oldest bytes into `dst`.
    size_t take(char* dst, size_t max) {
        Lock lock(mutex_);
        if (!lock.held()) return 0;

        const size_t n     = (size_ < max) ? size_ : max;
        const size_t first = (n < SIZE - start_) ? n : SIZE - start_;
        memcpy(dst, &buf_[start_], first);
        memcpy(dst + first, &buf_[0], n - first);
        start_ = (start_ + n) % SIZE;
        size_ -= n;
        return n;
    }

    size_t pending() {
        Lock lock(mutex_);
        return lock.held() ? size_ : 0;
    }

private:
    static constexpr size_t SIZE = GLINT_LOG_RING_SIZE;

    class Lock {
    public:
        explicit Lock(SemaphoreHandle_t m)
            : mutex_(m), held_(m != nullptr && xSemaphoreTake(m, LOCK_WAIT) == pdTRUE) {}
        ~Lock() { if (held_) xSemaphoreGive(mutex_); }
        bool held() const { return held_; }

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

    private:
        SemaphoreHandle_t mutex_;
        bool              held_;
    };

    char              buf_[SIZE] = {};
    size_t            start_ = 0;   // oldest byte
    size_t            size_  = 0;   // bytes buffered
    SemaphoreHandle_t mutex_ = nullptr;
};

LogRing s_ring;

} // anonymous namespace

bool log_init()
{
    return s_ring.init();
}

size_t log_pending()
{
    return s_ring.pending();
}

size_t log_drain(LogSink sink)
{
    if (sink == nullptr) return 0;

    char   chunk[DRAIN_CHUNK];
    size_t total = 0;
    size_t n;
    while ((n = s_ring.take(chunk, sizeof(chunk))) > 0) {
        sink(chunk, n);
        total += n;
    }
    return total;
}

void log_task(void* params)
{
    const LogSink sink = reinterpret_cast<LogSink>(params);

    for (;;) {
        log_drain(sink);
        vTaskDelay(pdMS_TO_TICKS(GLINT_LOG_DRAIN_PERIOD_MS));
    }
}

} // namespace glint

// ---------------------------------------------------------------------------
// glint_log
//
// Header and message are formatted into one stack line. A message longer than
// GLINT_LOG_MAX_MSG_LEN - 1 characters is cut; the line always ends in '\n'.
// Dropped if the ring is busy for more than 5 ms.
// ---------------------------------------------------------------------------
extern "C" void glint_log(const char* tag, const char* fmt, ...)
{
    char line[GLINT_LOG_MAX_MSG_LEN + 32];

    const uint32_t now_ms = static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
    const int hdr = snprintf(line, sizeof(line), "[%5" PRIu32 "ms][%-12s] ", now_ms, tag);
    if (hdr < 0) return;

    size_t len = (static_cast<size_t>(hdr) < sizeof(line) - 2) ? static_cast<size_t>(hdr)
                                                                : sizeof(line) - 2;

    // Room for the message and its NUL, keeping one byte for the newline.
    size_t room = sizeof(line) - len - 1;
    if (room > GLINT_LOG_MAX_MSG_LEN) room = GLINT_LOG_MAX_MSG_LEN;

    va_list args;
    va_start(args, fmt);
    const int body = vsnprintf(line + len, room, fmt, args);
    va_end(args);
    if (body < 0) return;

    len += (static_cast<size_t>(body) < room) ? static_cast<size_t>(body) : room - 1;
    line[len++] = '\n';

    glint::s_ring.append(line, len);
}

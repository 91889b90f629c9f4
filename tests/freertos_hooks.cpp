// SPDX-License-Identifier: MIT
// Host-side FreeRTOS hooks for the unit tests.

#include <cstdio>
#include <cstdlib>

// configASSERT lands here. Aborting lets death tests observe the failure.
extern "C" void vAssertCalled(const char* file, int line)
{
    std::fprintf(stderr, "configASSERT failed at %s:%d\n", file, line);
    std::abort();
}

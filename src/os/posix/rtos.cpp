#include "os/rtos.hpp"
#include <time.h>
#include <errno.h>

namespace Rtos {

// Sleep utility. Resumes after EINTR with the remaining time; callers keep
// their sleeps short so a stop request is seen on the next loop iteration.
void SleepMs(uint32_t ms) {
    timespec req{};
    req.tv_sec  = static_cast<time_t>(ms / 1000u);
    req.tv_nsec = static_cast<long>(ms % 1000u) * 1000000L;

    timespec rem{};
    while (::nanosleep(&req, &rem) == -1 && errno == EINTR) {
        req = rem;
    }
}

uint64_t MonoUs() {
    timespec ts{};
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

int64_t WallMs() {
    timespec ts{};
    ::clock_gettime(CLOCK_REALTIME, &ts);
    return int64_t(ts.tv_sec) * 1000ll + int64_t(ts.tv_nsec) / 1000000ll;
}

} // namespace Rtos

#include "timer.hpp"
#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <sys/timerfd.h>
#include <unistd.h>

Timer::Timer():
fd(-1),
armed(false)
{
}

Timer::~Timer()
{
    if (fd >= 0)
        close(fd);
}

void Timer::start(unsigned int period_ms)
{
    if (fd < 0) {
        fd = timerfd_create(CLOCK_MONOTONIC, TFD_CLOEXEC);
        if (fd < 0)
            throw std::runtime_error("Failed to create timer");
    }

    struct itimerspec val;
    val.it_value.tv_sec = period_ms / 1000;
    val.it_value.tv_nsec = (period_ms - val.it_value.tv_sec  * 1000) * 1000 * 1000;
    val.it_interval.tv_sec = 0;
    val.it_interval.tv_nsec = 0;
    if (timerfd_settime(fd, 0, &val, NULL) < 0)
        throw std::runtime_error("Failed to arm timer");

    /* A zero period disarms the timer */
    armed = period_ms > 0;
}

bool Timer::wait()
{
    if (fd < 0 || !armed)
        return false;

    uint64_t expirations;
    while (read(fd, &expirations, sizeof(expirations)) < 0) {
        if (errno != EINTR)
            return false;
    }

    armed = false;
    return true;
}

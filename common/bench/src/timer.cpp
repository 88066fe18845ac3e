#include <bench/timer.hpp>

#include <bench/run.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <ostream>
#include <time.h>

namespace {

std::chrono::nanoseconds CpuNow(CPUTimer::Type type) {
    auto clock = type == CPUTimer::Thread ? CLOCK_THREAD_CPUTIME_ID
                                          : CLOCK_PROCESS_CPUTIME_ID;
    timespec now{};
    if (::clock_gettime(clock, &now) != 0) {
        int err = errno;
        std::cerr << "Failed to read cpu clock: " << std::strerror(err)
                  << std::endl;
        std::abort();
    }
    return std::chrono::seconds{now.tv_sec} + std::chrono::nanoseconds{now.tv_nsec};
}

// Both clocks are read between fences so the kernel call being measured
// cannot be moved across the sample
CPUTimer::Times Sample(CPUTimer::Type type) {
    DoNotReorder();
    CPUTimer::Times sample{
        .wall_time = CPUTimer::WallClock::now().time_since_epoch(),
        .cpu_time = CpuNow(type),
    };
    DoNotReorder();
    return sample;
}

}  // namespace

CPUTimer::CPUTimer(Type type) : type_{type}, start_(Sample(type)) {
}

CPUTimer::Times CPUTimer::GetTimes() const {
    return Sample(type_) - start_;
}

CPUTimer::Times Measurement::PerIteration() const {
    if (iterations == 0) {
        return {};
    }
    return total / iterations;
}

std::ostream& operator<<(std::ostream& out, const Measurement& m) {
    using Micros = std::chrono::duration<double, std::micro>;

    auto avg = m.PerIteration();
    return out << m.name << ": "
               << std::chrono::duration_cast<Micros>(avg.wall_time).count()
               << " us wall, "
               << std::chrono::duration_cast<Micros>(avg.cpu_time).count()
               << " us cpu (" << m.iterations << " iterations)";
}

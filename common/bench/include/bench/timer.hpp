#pragma once

#include <chrono>
#include <cstddef>

class CPUTimer {
  public:
    using WallClock = std::chrono::steady_clock;

    enum Type {
        Thread,
        Process,
    };

    struct Times {
        WallClock::duration wall_time{0};
        std::chrono::nanoseconds cpu_time{0};

        Times operator+(const Times& other) const {
            return {
                .wall_time = wall_time + other.wall_time,
                .cpu_time = cpu_time + other.cpu_time,
            };
        }

        Times operator-(const Times& other) const {
            return {
                .wall_time = wall_time - other.wall_time,
                .cpu_time = cpu_time - other.cpu_time,
            };
        }

        Times operator/(size_t divisor) const {
            auto d = static_cast<WallClock::rep>(divisor);
            return {
                .wall_time = wall_time / d,
                .cpu_time = cpu_time / d,
            };
        }
    };

    // Kernels run on the calling thread, so thread time is the default
    explicit CPUTimer(Type type = Type::Thread);

    Times GetTimes() const;

  private:
    const Type type_;
    const Times start_;
};

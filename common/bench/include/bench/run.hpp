#pragma once

#include <bench/timer.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>

namespace detail {

void DoNotOptimize(const void*);

}

void DoNotReorder();

template <class T>
void DoNotOptimize(const T& v) {
    detail::DoNotOptimize(&v);
}

template <class F>
void InvokeDoNotOptimize(F&& f) {
    if constexpr (std::is_same_v<std::invoke_result_t<F>, void>) {
        f();
    } else {
        DoNotOptimize(f());
    }
}

template <class F>
CPUTimer::Times Run(F&& f) {
    CPUTimer timer;
    InvokeDoNotOptimize(std::forward<F>(f));
    return timer.GetTimes();
}

template <class F>
CPUTimer::Times RunWithWarmup(F&& f, size_t warmup, size_t measures) {
    for (size_t i = 0; i < warmup; ++i) {
        InvokeDoNotOptimize(f);
    }

    CPUTimer timer;

    for (size_t i = 0; i < measures; ++i) {
        InvokeDoNotOptimize(f);
    }

    return timer.GetTimes();
}

struct Measurement {
    std::string name;
    size_t iterations = 0;
    CPUTimer::Times total;

    CPUTimer::Times PerIteration() const;
};

// `setup` runs before every iteration outside of the timed region, so that
// in-place workloads always see the same input.
template <class Setup, class F>
Measurement Measure(std::string name, Setup&& setup, F&& f, size_t warmup,
                    size_t measures) {
    for (size_t i = 0; i < warmup; ++i) {
        setup();
        InvokeDoNotOptimize(f);
    }

    Measurement m{.name = std::move(name), .iterations = measures, .total = {}};
    for (size_t i = 0; i < measures; ++i) {
        setup();
        m.total = m.total + Run(f);
    }
    return m;
}

std::ostream& operator<<(std::ostream& out, const Measurement& m);

#include <bench/run.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <sstream>

using namespace std::chrono_literals;

static int64_t Spin(int64_t rounds) {
    int64_t acc = 0;
    for (int64_t i = 0; i < rounds; ++i) {
        acc += i ^ (acc >> 3);
        DoNotOptimize(acc);
    }
    return acc;
}

TEST_CASE("TimerAdvances") {
    CPUTimer timer;
    DoNotOptimize(Spin(5'000'000));
    auto times = timer.GetTimes();

    CHECK(times.cpu_time > 0ns);
    CHECK(times.wall_time > 0ns);
}

TEST_CASE("PerIteration") {
    Measurement m{.name = "x", .iterations = 4, .total = {}};
    m.total.wall_time = 400us;
    m.total.cpu_time = 200us;

    auto avg = m.PerIteration();
    CHECK(avg.wall_time == 100us);
    CHECK(avg.cpu_time == 50us);

    m.iterations = 0;
    CHECK(m.PerIteration().cpu_time == 0ns);
}

TEST_CASE("MeasureRunsSetupEveryIteration") {
    size_t setups = 0;
    size_t calls = 0;
    auto m = Measure(
        "counted",
        [&setups] {
            ++setups;
        },
        [&calls] {
            ++calls;
        },
        2, 5);

    CHECK(setups == 7);
    CHECK(calls == 7);
    CHECK(m.iterations == 5);
    CHECK(m.name == "counted");
}

TEST_CASE("Printing") {
    Measurement m{.name = "bubble_sort", .iterations = 2, .total = {}};
    m.total.wall_time = 3ms;
    m.total.cpu_time = 1ms;

    std::ostringstream out;
    out << m;
    CHECK(out.str() == "bubble_sort: 1500 us wall, 500 us cpu (2 iterations)");
}

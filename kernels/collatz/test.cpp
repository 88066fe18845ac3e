#include <kernels.h>

#include <build.hpp>
#include <pcg-random.hpp>

#include <catch2/catch_get_random_seed.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>

// Direct simulation with exact 64-bit arithmetic
static int32_t ExactSteps(int64_t n) {
    int32_t steps = 0;
    while (n > 1) {
        n = n % 2 == 0 ? n / 2 : 3 * n + 1;
        ++steps;
    }
    return steps;
}

// Direct simulation that wraps 3n + 1 into 32 bits
static int32_t WrappingSteps(int32_t n) {
    int32_t steps = 0;
    while (n > 1) {
        if (n % 2 == 0) {
            n /= 2;
        } else {
            n = static_cast<int32_t>(static_cast<uint32_t>(3 * int64_t{n} + 1));
        }
        ++steps;
    }
    return steps;
}

TEST_CASE("KnownValues") {
    CHECK(collatz_steps(1) == 0);
    CHECK(collatz_steps(2) == 1);
    CHECK(collatz_steps(3) == 7);
    CHECK(collatz_steps(6) == 8);
    CHECK(collatz_steps(7) == 16);
    CHECK(collatz_steps(27) == 111);
    CHECK(collatz_steps(97) == 118);
    CHECK(collatz_steps(871) == 178);
    CHECK(collatz_steps(6171) == 261);
    CHECK(collatz_steps(77031) == 350);
    CHECK(collatz_steps(1'000'000) == 152);
}

TEST_CASE("MatchesSimulation") {
    for (int32_t n = 1; n <= 10'000; ++n) {
        INFO("n = " << n);
        REQUIRE(collatz_steps(n) == ExactSteps(n));
    }
}

TEST_CASE("NonPositive") {
    CHECK(collatz_steps(0) == 0);
    CHECK(collatz_steps(-1) == 0);
    CHECK(collatz_steps(-2) == 0);
    CHECK(collatz_steps(-27) == 0);
    CHECK(collatz_steps(std::numeric_limits<int32_t>::min()) == 0);
}

TEST_CASE("WrappingOverflow") {
    SECTION("WrapsToZero") {
        // 3 * 1431655765 + 1 == 2^32
        CHECK(collatz_steps(1'431'655'765) == 1);
    }

    SECTION("WrapsToNegative") {
        // 3 * 715827883 + 1 == 2^31 + 2
        CHECK(collatz_steps(715'827'883) == 1);
    }

    SECTION("Extremes") {
        CHECK(collatz_steps(std::numeric_limits<int32_t>::max()) == 3);
        CHECK(collatz_steps(std::numeric_limits<int32_t>::max() - 1) == 2);
    }

    SECTION("DivergesFromExact") {
        // 113383 is the smallest start whose trajectory leaves int32_t
        CHECK(ExactSteps(113'383) == 247);
        CHECK(collatz_steps(113'383) == 120);
        CHECK(collatz_steps(113'382) == ExactSteps(113'382));

        CHECK(ExactSteps(837'799) == 524);
        CHECK(collatz_steps(837'799) == 58);
    }
}

TEST_CASE("Random") {
    static constexpr size_t kSamples = ForBuild(100'000, 2'000);
    PCGRandom rng{Catch::getSeed()};

    for (size_t i = 0; i < kSamples; ++i) {
        auto n = rng.GenerateInt32(1, std::numeric_limits<int32_t>::max());
        INFO("n = " << n);
        REQUIRE(collatz_steps(n) == WrappingSteps(n));
    }

    for (size_t i = 0; i < kSamples; ++i) {
        auto n = rng.GenerateInt32(1, 100'000);
        INFO("n = " << n);
        REQUIRE(collatz_steps(n) == ExactSteps(n));
    }
}

#include <kernel-module.hpp>

#include <pcg-random.hpp>

#include <catch2/catch_get_random_seed.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#if !defined(KERNELS_MODULE_PATH) || !defined(KERNELS_UNOPTIMIZED_MODULE_PATH) \
    || !defined(UNRELATED_MODULE_PATH)
#error "Module paths must point at the built libraries"
#endif

static KernelModule OpenKernels(const char* path = KERNELS_MODULE_PATH) {
    auto opened = KernelModule::Open(path);
    if (auto error = std::get_if<std::string>(&opened)) {
        FAIL("Failed to open " << path << ": " << *error);
    }
    return std::move(std::get<KernelModule>(opened));
}

static int32_t ExactSteps(int64_t n) {
    int32_t steps = 0;
    while (n > 1) {
        n = n % 2 == 0 ? n / 2 : 3 * n + 1;
        ++steps;
    }
    return steps;
}

TEST_CASE("Exports") {
    auto path = GENERATE(as<std::string>{}, KERNELS_MODULE_PATH,
                         KERNELS_UNOPTIMIZED_MODULE_PATH);
    INFO("Module " << path);
    auto module = OpenKernels(path.c_str());

    CHECK(module.HasSymbol("collatz_steps"));
    CHECK(module.HasSymbol("bubble_sort"));
    CHECK(module.CollatzStepsEntry() != nullptr);
    CHECK(module.BubbleSortEntry() != nullptr);

    // C linkage: the Itanium mangled spellings must not exist
    CHECK_FALSE(module.HasSymbol("_Z13collatz_stepsi"));
    CHECK_FALSE(module.HasSymbol("_Z11bubble_sortPim"));
    CHECK_FALSE(module.HasSymbol("_Z11bubble_sortPij"));
}

TEST_CASE("InlineMembersHidden") {
    // Built at -O0 -fno-inline, so these members exist as weak definitions
    // and only the visibility settings keep them out of the symbol table
    auto module = OpenKernels(KERNELS_UNOPTIMIZED_MODULE_PATH);

    CHECK_FALSE(module.HasSymbol("_ZN17MutableBufferViewC1EPim"));
    CHECK_FALSE(module.HasSymbol("_ZN17MutableBufferViewC2EPim"));
    CHECK_FALSE(module.HasSymbol("_ZN17MutableBufferView12SwapAdjacentEm"));
    CHECK_FALSE(module.HasSymbol("_ZNK17MutableBufferView4SizeEv"));
    CHECK_FALSE(module.HasSymbol("_ZNK17MutableBufferView5EmptyEv"));
    CHECK_FALSE(module.HasSymbol("_ZNK17MutableBufferViewixEm"));
    CHECK_FALSE(module.HasSymbol("_ZNKSt4spanIiLm18446744073709551615EE4sizeEv"));
}

TEST_CASE("OpenErrors") {
    SECTION("NoSuchFile") {
        auto opened = KernelModule::Open("/nonexistent/libkernels.so");
        REQUIRE(std::holds_alternative<std::string>(opened));
        CHECK_FALSE(std::get<std::string>(opened).empty());
    }

    SECTION("NotAKernelModule") {
        auto opened = KernelModule::Open(UNRELATED_MODULE_PATH);
        REQUIRE(std::holds_alternative<std::string>(opened));
        auto& error = std::get<std::string>(opened);
        CHECK(error.find("collatz_steps") != std::string::npos);
    }
}

TEST_CASE("CallsThroughModule") {
    auto path = GENERATE(as<std::string>{}, KERNELS_MODULE_PATH,
                         KERNELS_UNOPTIMIZED_MODULE_PATH);
    INFO("Module " << path);
    auto module = OpenKernels(path.c_str());

    CHECK(module.CollatzSteps(1) == 0);
    CHECK(module.CollatzSteps(6) == 8);
    CHECK(module.CollatzSteps(27) == 111);
    CHECK(module.CollatzSteps(-5) == 0);
    CHECK(module.CollatzSteps(1'431'655'765) == 1);

    for (int32_t n = 1; n <= 10'000; ++n) {
        INFO("n = " << n);
        REQUIRE(module.CollatzSteps(n) == ExactSteps(n));
    }

    std::vector<int32_t> arr = {5, 4, 3, 2, 1};
    module.BubbleSort(arr);
    CHECK(arr == std::vector<int32_t>{1, 2, 3, 4, 5});

    module.BubbleSort({});
}

TEST_CASE("RawEntryPoints") {
    auto module = OpenKernels();
    PCGRandom rng{Catch::getSeed()};

    std::vector<int32_t> arr(300);
    rng.Fill(arr);
    auto expected = arr;
    std::sort(expected.begin(), expected.end());

    // What a runtime does after resolving the symbol: raw address and count
    auto sort = module.BubbleSortEntry();
    sort(arr.data(), arr.size());
    CHECK(arr == expected);

    auto steps = module.CollatzStepsEntry();
    CHECK(steps(871) == 178);
}

TEST_CASE("Movable") {
    auto module = OpenKernels();
    auto moved = std::move(module);
    CHECK(moved.CollatzSteps(6171) == 261);

    auto other = OpenKernels();
    other = std::move(moved);
    CHECK(other.CollatzSteps(27) == 111);
}

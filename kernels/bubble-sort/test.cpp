#include <kernels.h>

#include <bench/run.hpp>
#include <build.hpp>
#include <checksum.hpp>
#include <guarded-buffer.hpp>
#include <pcg-random.hpp>

#include <catch2/catch_get_random_seed.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <numeric>
#include <span>
#include <vector>

using namespace std::chrono_literals;

static void Sort(std::span<int32_t> buffer) {
    bubble_sort(buffer.data(), buffer.size());
}

static void CheckSortedPermutation(std::span<const int32_t> result,
                                   std::span<const int32_t> original) {
    REQUIRE(result.size() == original.size());
    {
        INFO("Array elements set has changed");
        REQUIRE(UnorderedDigest(result) == UnorderedDigest(original));
    }

    std::vector<int32_t> expected(original.begin(), original.end());
    std::sort(expected.begin(), expected.end());
    for (size_t i = 0; i < result.size(); ++i) {
        INFO("Element #" << i);
        REQUIRE(result[i] == expected[i]);
    }
}

TEST_CASE("Simple") {
    std::vector<int32_t> arr = {5, 4, 3, 2, 1};
    Sort(arr);
    CHECK(arr == std::vector<int32_t>{1, 2, 3, 4, 5});

    arr = {64, 34, 25, 12, 22, 11, 90, 88, 15, 76};
    Sort(arr);
    CHECK(arr ==
          std::vector<int32_t>{11, 12, 15, 22, 25, 34, 64, 76, 88, 90});

    arr = {2, -1, 2, -1, 0};
    Sort(arr);
    CHECK(arr == std::vector<int32_t>{-1, -1, 0, 2, 2});
}

TEST_CASE("Empty") {
    SECTION("NullAddress") {
        bubble_sort(nullptr, 0);
    }

    SECTION("AtGuardPage") {
        GuardedBuffer buffer{0};
        bubble_sort(buffer.Data(), 0);
        CHECK(buffer.Size() == 0);
    }
}

TEST_CASE("SingleElement") {
    GuardedBuffer buffer{1};
    buffer.Data()[0] = 42;
    buffer.SetReadOnly(true);
    bubble_sort(buffer.Data(), 1);
    buffer.SetReadOnly(false);
    CHECK(buffer.Data()[0] == 42);
}

TEST_CASE("ExtremeValues") {
    constexpr auto kMin = std::numeric_limits<int32_t>::min();
    constexpr auto kMax = std::numeric_limits<int32_t>::max();

    std::vector<int32_t> arr = {kMax, 0, kMin, -1, kMax, 1, kMin};
    auto original = arr;
    Sort(arr);
    CheckSortedPermutation(arr, original);
    CHECK(arr.front() == kMin);
    CHECK(arr.back() == kMax);
}

TEST_CASE("Idempotent") {
    PCGRandom rng{Catch::getSeed()};

    for (size_t size : {0, 1, 2, 17, 500}) {
        std::vector<int32_t> arr(size);
        rng.Fill(arr, -50, 50);

        Sort(arr);
        auto once = arr;
        Sort(arr);
        CHECK(arr == once);
    }
}

TEST_CASE("EqualKeysStayInPlace") {
    PCGRandom rng{Catch::getSeed()};

    // A swap of two equal neighbours would write to read-only memory
    SECTION("AllEqual") {
        GuardedBuffer buffer{1000};
        std::ranges::fill(buffer.Elements(), 7);
        buffer.SetReadOnly(true);
        bubble_sort(buffer.Data(), buffer.Size());
        buffer.SetReadOnly(false);
        CHECK(std::ranges::count(buffer.Elements(), 7) == 1000);
    }

    SECTION("SortedRuns") {
        GuardedBuffer buffer{3000};
        rng.Fill(buffer.Elements(), -20, 20);
        std::ranges::sort(buffer.Elements());
        auto digest = OrderedDigest(buffer.Elements());

        buffer.SetReadOnly(true);
        bubble_sort(buffer.Data(), buffer.Size());
        buffer.SetReadOnly(false);
        CHECK(OrderedDigest(buffer.Elements()) == digest);
    }
}

TEST_CASE("GuardedBounds") {
    PCGRandom rng{Catch::getSeed()};

    auto placement = GENERATE(GuardedBuffer::Placement::AgainstEnd,
                              GuardedBuffer::Placement::AgainstBegin);
    INFO("Placement " << static_cast<int>(placement));

    for (size_t size = 1; size <= 64; ++size) {
        GuardedBuffer buffer{size, placement};
        rng.Fill(buffer.Elements());
        std::vector<int32_t> original(buffer.Elements().begin(),
                                      buffer.Elements().end());

        bubble_sort(buffer.Data(), buffer.Size());
        CheckSortedPermutation(buffer.Elements(), original);
    }

    // Exactly one page worth of elements, flush with both guards
    GuardedBuffer page{PageSize() / sizeof(int32_t), placement};
    rng.Fill(page.Elements());
    std::vector<int32_t> original(page.Elements().begin(),
                                  page.Elements().end());
    bubble_sort(page.Data(), page.Size());
    CheckSortedPermutation(page.Elements(), original);
}

TEST_CASE("Random") {
    static constexpr auto kMaxSize = static_cast<int32_t>(ForBuild(2'000, 500));
    PCGRandom rng{Catch::getSeed()};

    for (size_t i = 0; i < 50; ++i) {
        auto size = static_cast<size_t>(rng.GenerateInt32(0, kMaxSize));
        std::vector<int32_t> arr(size);
        if (i % 2 == 0) {
            rng.Fill(arr);
        } else {
            rng.Fill(arr, -10, 10);
        }
        auto original = arr;

        Sort(arr);
        CheckSortedPermutation(arr, original);
    }
}

TEST_CASE("Subrange") {
    PCGRandom rng{Catch::getSeed()};

    std::vector<int32_t> arr(100);
    rng.Fill(arr);
    auto original = arr;

    Sort(std::span{arr}.subspan(20, 50));

    CHECK(std::equal(arr.begin(), arr.begin() + 20, original.begin()));
    CHECK(std::equal(arr.begin() + 70, arr.end(), original.begin() + 70));
    CheckSortedPermutation(std::span{arr}.subspan(20, 50),
                           std::span{original}.subspan(20, 50));
}

TEST_CASE("Performance") {
    if constexpr (kBuildType != BuildType::Release) {
        return;
    }

    std::vector<int32_t> arr(5'000);
    auto times = RunWithWarmup(
        [&arr] {
            std::iota(arr.rbegin(), arr.rend(), 0);
            Sort(arr);
        },
        1, 5);
    CHECK(std::is_sorted(arr.begin(), arr.end()));
    CHECK(times.cpu_time < 2s);
}

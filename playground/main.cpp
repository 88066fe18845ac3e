#include <bench/run.hpp>
#include <kernel-module.hpp>

#include <cstdint>
#include <iostream>
#include <numeric>
#include <variant>
#include <vector>

static void RunCollatzDemo(const KernelModule& module) {
    std::cout << "Running Collatz Conjecture..." << std::endl;
    for (int32_t n : {27, 871, 6171}) {
        std::cout << "Number: " << n << " -> Steps: " << module.CollatzSteps(n)
                  << std::endl;
    }
}

static void RunSortDemo(const KernelModule& module) {
    std::vector<int32_t> arr = {64, 34, 25, 12, 22, 11, 90, 88, 15, 76};
    module.BubbleSort(arr);

    std::cout << "Sorted array: " << std::endl;
    for (auto v : arr) {
        std::cout << v << " ";
    }
    std::cout << std::endl;
}

static void RunBenchmarks(const KernelModule& module) {
    constexpr int32_t kCollatzLimit = 10'000;
    constexpr size_t kSortSize = 2'000;

    auto collatz = Measure(
        "collatz_steps [1, 10000]", [] {},
        [&module] {
            int64_t total = 0;
            for (int32_t n = 1; n <= kCollatzLimit; ++n) {
                total += module.CollatzSteps(n);
            }
            return total;
        },
        3, 20);
    std::cout << collatz << std::endl;

    std::vector<int32_t> buffer(kSortSize);
    auto descending = [&buffer] {
        std::iota(buffer.rbegin(), buffer.rend(), 0);
    };
    auto sort = Measure(
        "bubble_sort descending x2000", descending,
        [&module, &buffer] {
            module.BubbleSort(buffer);
        },
        1, 5);
    std::cout << sort << std::endl;
}

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <kernel module>" << std::endl;
        return 1;
    }

    auto opened = KernelModule::Open(argv[1]);
    if (auto error = std::get_if<std::string>(&opened)) {
        std::cerr << "Failed to load " << argv[1] << ": " << *error
                  << std::endl;
        return 1;
    }
    auto& module = std::get<KernelModule>(opened);

    RunCollatzDemo(module);
    RunSortDemo(module);
    RunBenchmarks(module);
}

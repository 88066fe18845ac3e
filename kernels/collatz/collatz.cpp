#include <kernels.h>

#include <cstdint>

namespace {

// Two's complement wrap instead of signed overflow
int32_t TriplePlusOne(int32_t n) {
    auto image = static_cast<uint32_t>(n);
    return static_cast<int32_t>(image * 3u + 1u);
}

}  // namespace

extern "C" int32_t collatz_steps(int32_t n) {
    int32_t steps = 0;
    while (n > 1) {
        if (n % 2 == 0) {
            n /= 2;
        } else {
            n = TriplePlusOne(n);
        }
        ++steps;
    }
    return steps;
}

#include <kernels.h>

#include "buffer-view.hpp"

#include <cstddef>
#include <cstdint>

namespace {

void SortInPlace(MutableBufferView& view) {
    if (view.Empty()) {
        return;
    }

    auto n = view.Size();
    for (size_t pass = 0; pass < n; ++pass) {
        // Largest `pass` elements are already in their final positions
        auto unsorted = n - pass;
        for (size_t j = 0; j + 1 < unsorted; ++j) {
            if (view[j] > view[j + 1]) {
                view.SwapAdjacent(j);
            }
        }
    }
}

}  // namespace

extern "C" void bubble_sort(int32_t* ptr, size_t len) {
    MutableBufferView view{ptr, len};
    SortInPlace(view);
}

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

extern "C" int32_t CollatzFromC(int32_t n);
extern "C" void SortFromC(int32_t* ptr, size_t len);
extern "C" int SortFixedArrayFromC();

TEST_CASE("CallsFromC") {
    CHECK(CollatzFromC(1) == 0);
    CHECK(CollatzFromC(6) == 8);
    CHECK(CollatzFromC(27) == 111);
    CHECK(CollatzFromC(0) == 0);

    CHECK(SortFixedArrayFromC() == 1);

    std::vector<int32_t> arr = {3, -7, 3, 0, 12, -7};
    SortFromC(arr.data(), arr.size());
    CHECK(arr == std::vector<int32_t>{-7, -7, 0, 3, 3, 12});

    SortFromC(nullptr, 0);
}

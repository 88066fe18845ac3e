#include <guarded-buffer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

#ifndef __linux__
#error "Only linux is supported for this test"
#endif

static size_t MappingsCount() {
    std::ifstream maps{"/proc/self/maps"};
    REQUIRE(maps.is_open());

    size_t count = 0;
    for (std::string line; std::getline(maps, line);) {
        ++count;
    }
    return count;
}

static bool IsPageAligned(const void* ptr) {
    return reinterpret_cast<uintptr_t>(ptr) % PageSize() == 0;
}

TEST_CASE("Placement") {
    for (size_t size : {0, 1, 3, 1024, 1025, 5000}) {
        INFO("size = " << size);

        GuardedBuffer end{size, GuardedBuffer::Placement::AgainstEnd};
        CHECK(end.Size() == size);
        CHECK(IsPageAligned(end.Data() + end.Size()));

        GuardedBuffer begin{size, GuardedBuffer::Placement::AgainstBegin};
        CHECK(begin.Size() == size);
        CHECK(IsPageAligned(begin.Data()));
    }
}

TEST_CASE("Writable") {
    GuardedBuffer buffer{2000};
    for (size_t i = 0; i < buffer.Size(); ++i) {
        buffer.Data()[i] = static_cast<int32_t>(i);
    }

    buffer.SetReadOnly(true);
    int64_t sum = 0;
    for (auto v : buffer.Elements()) {
        sum += v;
    }
    buffer.SetReadOnly(false);

    buffer.Data()[0] = 7;
    CHECK(sum == 1999 * 2000 / 2);
    CHECK(buffer.Data()[0] == 7);
}

TEST_CASE("ReleasesMappings") {
    // Warm up anything the allocator or the stream maps lazily
    MappingsCount();
    { GuardedBuffer warmup{16}; }

    auto before = MappingsCount();
    for (size_t i = 0; i < 100; ++i) {
        GuardedBuffer buffer{i * 100, i % 2 == 0
                                          ? GuardedBuffer::Placement::AgainstEnd
                                          : GuardedBuffer::Placement::AgainstBegin};
        buffer.SetReadOnly(true);
    }
    CHECK(MappingsCount() == before);
}

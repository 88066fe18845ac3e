#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

// int32_t buffer surrounded by inaccessible pages. The elements touch one of
// the guard pages, so stepping past that edge faults immediately.
class GuardedBuffer {
  public:
    enum class Placement {
        AgainstEnd,
        AgainstBegin,
    };

    explicit GuardedBuffer(size_t size,
                           Placement placement = Placement::AgainstEnd);

    GuardedBuffer(const GuardedBuffer&) = delete;
    GuardedBuffer(GuardedBuffer&&) = delete;

    GuardedBuffer& operator=(const GuardedBuffer&) = delete;
    GuardedBuffer& operator=(GuardedBuffer&&) = delete;

    // For an empty buffer this points at the first byte of a guard page
    int32_t* Data() {
        return data_;
    }

    size_t Size() const {
        return size_;
    }

    std::span<int32_t> Elements() {
        return {data_, size_};
    }

    // Any write to the elements faults until made writable again
    void SetReadOnly(bool read_only);

  private:
    struct Unmap {
        size_t size = 0;

        void operator()(void* mapping) const;
    };

    std::unique_ptr<void, Unmap> mapping_;
    size_t data_pages_;
    int32_t* data_;
    size_t size_;
};

size_t PageSize();

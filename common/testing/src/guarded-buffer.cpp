#include <guarded-buffer.hpp>

#include <internal-assert.hpp>

#include <sys/mman.h>
#include <unistd.h>

size_t PageSize() {
    static const size_t kPageSize = [] {
        long size = ::sysconf(_SC_PAGESIZE);
        INTERNAL_ASSERT(size > 0);
        return static_cast<size_t>(size);
    }();
    return kPageSize;
}

GuardedBuffer::GuardedBuffer(size_t size, Placement placement) : size_(size) {
    auto page = PageSize();
    auto bytes = size * sizeof(int32_t);
    data_pages_ = (bytes + page - 1) / page;
    auto mapping_size = (data_pages_ + 2) * page;

    auto mapping = ::mmap(nullptr, mapping_size, PROT_READ | PROT_WRITE,
                          MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    INTERNAL_ASSERT(mapping != MAP_FAILED);
    // Owned from here on: a failed assert below still unmaps it
    mapping_ = std::unique_ptr<void, Unmap>{mapping, Unmap{mapping_size}};

    auto base = static_cast<std::byte*>(mapping);
    auto trailing_guard = base + (data_pages_ + 1) * page;
    {
        int ret = ::mprotect(base, page, PROT_NONE);
        INTERNAL_ASSERT(ret == 0);
    }
    {
        int ret = ::mprotect(trailing_guard, page, PROT_NONE);
        INTERNAL_ASSERT(ret == 0);
    }

    std::byte* first = nullptr;
    switch (placement) {
    case Placement::AgainstEnd:
        first = trailing_guard - bytes;
        break;
    case Placement::AgainstBegin:
        first = base + page;
        break;
    }
    data_ = reinterpret_cast<int32_t*>(first);
}

void GuardedBuffer::Unmap::operator()(void* mapping) const {
    int ret = ::munmap(mapping, size);
    INTERNAL_ASSERT(ret == 0);
}

void GuardedBuffer::SetReadOnly(bool read_only) {
    if (data_pages_ == 0) {
        return;
    }
    auto page = PageSize();
    auto data_begin = static_cast<std::byte*>(mapping_.get()) + page;
    int ret = ::mprotect(data_begin, data_pages_ * page,
                         read_only ? PROT_READ : PROT_READ | PROT_WRITE);
    INTERNAL_ASSERT(ret == 0);
}

#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

// Exclusive borrow of a caller's buffer for the duration of one exported
// call. Built once from the raw (ptr, len) pair at the boundary; all element
// access goes through it afterwards.
class MutableBufferView {
  public:
    MutableBufferView(int32_t* ptr, size_t len)
        : elements_(len == 0 ? std::span<int32_t>{}
                             : std::span<int32_t>{ptr, len}) {
    }

    MutableBufferView(const MutableBufferView&) = delete;
    MutableBufferView(MutableBufferView&&) = delete;

    MutableBufferView& operator=(const MutableBufferView&) = delete;
    MutableBufferView& operator=(MutableBufferView&&) = delete;

    size_t Size() const {
        return elements_.size();
    }

    bool Empty() const {
        return elements_.empty();
    }

    int32_t operator[](size_t i) const {
        assert(i < Size());
        return elements_[i];
    }

    void SwapAdjacent(size_t i) {
        assert(i + 1 < Size());
        std::swap(elements_[i], elements_[i + 1]);
    }

  private:
    std::span<int32_t> elements_;
};

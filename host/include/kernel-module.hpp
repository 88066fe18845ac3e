#pragma once

#include <kernels.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>

// The host side of the boundary: a loaded kernel module with both exports
// resolved by name.
class KernelModule {
  public:
    // Error alternative holds the dynamic loader's message
    static std::variant<KernelModule, std::string> Open(const char* path);

    KernelModule(const KernelModule&) = delete;
    KernelModule& operator=(const KernelModule&) = delete;

    KernelModule(KernelModule&& other) noexcept;
    KernelModule& operator=(KernelModule&& other) noexcept;

    ~KernelModule();

    int32_t CollatzSteps(int32_t n) const;

    // The span is lowered to (data, size) exactly once, here
    void BubbleSort(std::span<int32_t> buffer) const;

    bool HasSymbol(const char* name) const;

    collatz_steps_fn CollatzStepsEntry() const {
        return collatz_steps_;
    }

    bubble_sort_fn BubbleSortEntry() const {
        return bubble_sort_;
    }

  private:
    KernelModule(void* handle, collatz_steps_fn collatz_steps,
                 bubble_sort_fn bubble_sort);

    void Close();

    void* handle_;
    collatz_steps_fn collatz_steps_;
    bubble_sort_fn bubble_sort_;
};

#include <kernel-module.hpp>

#include <dlfcn.h>
#include <iostream>
#include <utility>

namespace {

std::string LastLoaderError() {
    if (auto message = ::dlerror()) {
        return message;
    }
    return "unknown dynamic loader error";
}

template <class Fn>
Fn Resolve(void* handle, const char* name) {
    ::dlerror();
    return reinterpret_cast<Fn>(::dlsym(handle, name));
}

}  // namespace

std::variant<KernelModule, std::string> KernelModule::Open(const char* path) {
    auto handle = ::dlopen(path, RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        return LastLoaderError();
    }

    auto collatz = Resolve<collatz_steps_fn>(handle, "collatz_steps");
    auto sort = Resolve<bubble_sort_fn>(handle, "bubble_sort");
    if (collatz == nullptr || sort == nullptr) {
        std::string error = "missing export '";
        error += collatz == nullptr ? "collatz_steps" : "bubble_sort";
        error += "' in ";
        error += path;
        if (::dlclose(handle) != 0) {
            error += " (close failed: " + LastLoaderError() + ")";
        }
        return error;
    }

    return KernelModule{handle, collatz, sort};
}

KernelModule::KernelModule(void* handle, collatz_steps_fn collatz_steps,
                           bubble_sort_fn bubble_sort)
    : handle_{handle}, collatz_steps_{collatz_steps}, bubble_sort_{bubble_sort} {
}

KernelModule::KernelModule(KernelModule&& other) noexcept
    : handle_{std::exchange(other.handle_, nullptr)},
      collatz_steps_{std::exchange(other.collatz_steps_, nullptr)},
      bubble_sort_{std::exchange(other.bubble_sort_, nullptr)} {
}

KernelModule& KernelModule::operator=(KernelModule&& other) noexcept {
    if (this != &other) {
        Close();
        handle_ = std::exchange(other.handle_, nullptr);
        collatz_steps_ = std::exchange(other.collatz_steps_, nullptr);
        bubble_sort_ = std::exchange(other.bubble_sort_, nullptr);
    }
    return *this;
}

KernelModule::~KernelModule() {
    Close();
}

void KernelModule::Close() {
    auto handle = std::exchange(handle_, nullptr);
    if (handle == nullptr) {
        return;
    }
    collatz_steps_ = nullptr;
    bubble_sort_ = nullptr;
    if (::dlclose(handle) != 0) {
        std::cerr << "Failed to unload kernel module: " << LastLoaderError()
                  << std::endl;
    }
}

int32_t KernelModule::CollatzSteps(int32_t n) const {
    return collatz_steps_(n);
}

void KernelModule::BubbleSort(std::span<int32_t> buffer) const {
    bubble_sort_(buffer.data(), buffer.size());
}

bool KernelModule::HasSymbol(const char* name) const {
    return Resolve<void*>(handle_, name) != nullptr;
}

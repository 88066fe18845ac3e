#pragma once

#include <cstddef>

enum class BuildType {
    Release,
    Debug,
    ASan,
    TSan,
};

constexpr inline BuildType kBuildType =
#if defined(RELEASE)
    BuildType::Release
#elif defined(DEBUG)
    BuildType::Debug
#elif defined(ASAN)
    BuildType::ASan
#elif defined(TSAN)
    BuildType::TSan
#else
#error "Unable to get build type"
#endif
    ;

// Quadratic workloads are sized down outside of optimized builds
constexpr inline size_t ForBuild(size_t release, size_t other) {
    return kBuildType == BuildType::Release ? release : other;
}

#pragma once

#include <cstdint>
#include <span>

uint64_t Hash(uint64_t v);

// Changes whenever the sequence changes, including reorderings
struct OrderedCheckSum {
    uint64_t GetDigest() const;
    void Append(uint64_t v);
    void Append(std::span<const int32_t> r);

  private:
    uint64_t digest_ = 0;
};

// Depends only on the multiset of appended values
struct UnorderedCheckSum {
    uint64_t GetDigest() const;
    void Append(uint64_t v);
    void Append(std::span<const int32_t> r);

  private:
    uint64_t digest_ = 0;
};

uint64_t OrderedDigest(std::span<const int32_t> r);
uint64_t UnorderedDigest(std::span<const int32_t> r);

#include <checksum.hpp>

#include <bit>

// Some silly bijection
uint64_t Hash(uint64_t c) {
    c += 0x15373035281943C9;
    c ^= 0x895EBF833CC1E9FB;
    c *= 0x61FAB941BB1CF167;
    return c;
}

static uint64_t Widen(int32_t v) {
    return static_cast<uint64_t>(static_cast<uint32_t>(v));
}

uint64_t OrderedCheckSum::GetDigest() const {
    return digest_;
}

void OrderedCheckSum::Append(uint64_t c) {
    digest_ *= 424243;
    digest_ ^= Hash(c);
    digest_ = std::rotr(digest_, digest_ >> 58);
}

void OrderedCheckSum::Append(std::span<const int32_t> r) {
    for (auto v : r) {
        Append(Widen(v));
    }
}

uint64_t UnorderedCheckSum::GetDigest() const {
    return digest_;
}

void UnorderedCheckSum::Append(uint64_t v) {
    digest_ += Hash(v);
}

void UnorderedCheckSum::Append(std::span<const int32_t> r) {
    for (auto v : r) {
        Append(Widen(v));
    }
}

uint64_t OrderedDigest(std::span<const int32_t> r) {
    OrderedCheckSum c;
    c.Append(r);
    return c.GetDigest();
}

uint64_t UnorderedDigest(std::span<const int32_t> r) {
    UnorderedCheckSum c;
    c.Append(r);
    return c.GetDigest();
}

#include "random_streams.hpp"

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

inline std::uint32_t low32(std::uint64_t value) { return static_cast<std::uint32_t>(value); }
inline std::uint32_t high32(std::uint64_t value) { return static_cast<std::uint32_t>(value >> 32); }

}  // namespace

std::uint64_t riskStreamKey(std::string_view riskId) noexcept {
    std::uint64_t hash = kFnvOffset;
    for (const char c : riskId) {
        hash ^= static_cast<std::uint8_t>(c);
        hash *= kFnvPrime;
    }
    return hash;
}

Rng makeStream(std::uint64_t seed,
               std::uint64_t blockIndex,
               std::uint64_t riskKey,
               RandomStream stream) {
    std::seed_seq seq{low32(seed),     high32(seed),     low32(blockIndex), high32(blockIndex),
                      low32(riskKey),  high32(riskKey),  static_cast<std::uint32_t>(stream)};
    return Rng(seq);
}

std::uint64_t randomSeed() {
    std::random_device device;
    const std::uint64_t hi = device();
    const std::uint64_t lo = device();
    return (hi << 32) ^ lo;
}

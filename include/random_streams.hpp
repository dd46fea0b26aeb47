#pragma once

#include <cstdint>
#include <random>
#include <string_view>

using Rng = std::mt19937_64;

// Occurrence and magnitude draws never share a generator, so changing a
// risk's probability cannot shift the magnitudes it draws when it occurs.
enum class RandomStream : std::uint32_t { Occurrence = 0, Magnitude = 1 };

// Stable 64-bit key for a risk id (FNV-1a). Streams are keyed by id rather
// than by position so that adding or removing other risks leaves a risk's
// draws untouched.
[[nodiscard]] std::uint64_t riskStreamKey(std::string_view riskId) noexcept;

[[nodiscard]] Rng makeStream(std::uint64_t seed,
                             std::uint64_t blockIndex,
                             std::uint64_t riskKey,
                             RandomStream stream);

// Fresh non-deterministic seed for runs that did not supply one.
[[nodiscard]] std::uint64_t randomSeed();

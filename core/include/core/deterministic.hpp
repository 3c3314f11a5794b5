#pragma once
/**
 * @file deterministic.hpp
 * @brief Deterministic utilities for reproducible batches
 *
 * This header provides:
 * - Xoshiro256** RNG for reproducible image-pool shuffles
 * - FNV-1a hashing for output validation
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace WordCard::Deterministic {

// ============================================================================
// Deterministic RNG (Xoshiro256**)
// ============================================================================

/**
 * @brief Fast PRNG with deterministic output
 *
 * Same seed gives the same sequence on every platform, unlike
 * std::shuffle whose algorithm is implementation-defined.
 */
class DeterministicRNG {
public:
  /// Initialize with seed
  explicit DeterministicRNG(uint64_t seed) noexcept {
    // Use splitmix64 to expand single seed to full state
    state_[0] = splitmix64(seed);
    state_[1] = splitmix64(seed);
    state_[2] = splitmix64(seed);
    state_[3] = splitmix64(seed);
  }

  /// Generate next 64-bit random value
  [[nodiscard]] uint64_t next() noexcept {
    const uint64_t result = rotl(state_[1] * 5, 7) * 9;
    const uint64_t t = state_[1] << 17;

    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];

    state_[2] ^= t;
    state_[3] = rotl(state_[3], 45);

    return result;
  }

  /// Uniform index in [0, bound)
  [[nodiscard]] size_t next_index(size_t bound) noexcept {
    if (bound <= 1)
      return 0;
    return static_cast<size_t>(next() % static_cast<uint64_t>(bound));
  }

private:
  std::array<uint64_t, 4> state_;

  [[nodiscard]] static constexpr uint64_t rotl(uint64_t x, int k) noexcept {
    return (x << k) | (x >> (64 - k));
  }

  [[nodiscard]] static uint64_t splitmix64(uint64_t &x) noexcept {
    uint64_t z = (x += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
  }
};

/// Fisher-Yates shuffle driven by DeterministicRNG
template <typename T>
void shuffle(std::vector<T> &items, uint64_t seed) noexcept {
  DeterministicRNG rng(seed);
  for (size_t i = items.size(); i > 1; --i) {
    size_t j = rng.next_index(i);
    std::swap(items[i - 1], items[j]);
  }
}

// ============================================================================
// Hashing
// ============================================================================

/**
 * @brief FNV-1a 64-bit hash
 *
 * Fast, deterministic hash suitable for frame validation.
 */
[[nodiscard]] inline uint64_t
compute_pixel_hash(std::span<const uint8_t> pixels) noexcept {
  constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
  constexpr uint64_t FNV_PRIME = 1099511628211ULL;

  uint64_t hash = FNV_OFFSET;
  for (uint8_t byte : pixels) {
    hash ^= byte;
    hash *= FNV_PRIME;
  }
  return hash;
}

} // namespace WordCard::Deterministic

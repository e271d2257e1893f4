#pragma once

#include <cstddef>
#include <cstdint>

namespace aquarium::sim {

// PCG32 (XSH-RR) stream. Meets UniformRandomBitGenerator so it also drives <algorithm>.
class Pcg32 final {
public:
  using result_type = std::uint32_t;

  static constexpr std::uint64_t kDefaultStream{0xDA3E39CB94B95BDBULL};

  constexpr Pcg32() noexcept : Pcg32(0U) {}
  explicit constexpr Pcg32(std::uint64_t seed, std::uint64_t stream = kDefaultStream) noexcept { reseed(seed, stream); }

  constexpr void reseed(std::uint64_t seed, std::uint64_t stream = kDefaultStream) noexcept {
    inc_ = (stream << 1U) | 1U;
    state_ = 0U;
    step();
    state_ += seed;
    step();
  }

  [[nodiscard]] static constexpr result_type min() noexcept { return 0U; }
  [[nodiscard]] static constexpr result_type max() noexcept { return 0xFFFFFFFFU; }

  constexpr result_type operator()() noexcept {
    const std::uint64_t old = state_;
    step();
    const auto xorshifted = static_cast<std::uint32_t>(((old >> 18U) ^ old) >> 27U);
    const auto rot = static_cast<std::uint32_t>(old >> 59U);
    return (xorshifted >> rot) | (xorshifted << ((0U - rot) & 31U));
  }

  // [0, bound), multiply-shift with rejection of the biased low range. 0 when bound is 0.
  [[nodiscard]] constexpr std::uint32_t below(std::uint32_t bound) noexcept {
    if (bound == 0U) return 0U;
    std::uint64_t m = static_cast<std::uint64_t>((*this)()) * bound;
    if (static_cast<std::uint32_t>(m) < bound) {
      const std::uint32_t reject_below = (0U - bound) % bound;
      while (static_cast<std::uint32_t>(m) < reject_below) m = static_cast<std::uint64_t>((*this)()) * bound;
    }
    return static_cast<std::uint32_t>(m >> 32U);
  }

  // [0, 1) with 53 bits of two draws.
  [[nodiscard]] constexpr double unit() noexcept {
    const std::uint64_t bits = (static_cast<std::uint64_t>((*this)()) << 32U) | (*this)();
    return static_cast<double>(bits >> 11U) * 0x1.0p-53;
  }

private:
  constexpr void step() noexcept { state_ = state_ * 6364136223846793005ULL + inc_; }

  std::uint64_t state_{0U};
  std::uint64_t inc_{1U};
};

// Uniform randomness used for speed tie-breaks, target selection and AI picks.
// Passed explicitly; one stream per session.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform in [0, 1).
  [[nodiscard]] virtual double next_unit() = 0;

  // Uniform in [0, count). Returns 0 when count is 0.
  [[nodiscard]] virtual std::size_t next_index(std::size_t count) = 0;

  [[nodiscard]] bool chance(double probability) { return next_unit() < probability; }
};

class PcgRandomSource final : public RandomSource {
public:
  explicit PcgRandomSource(std::uint64_t seed) noexcept : rng_(seed) {}

  [[nodiscard]] double next_unit() override { return rng_.unit(); }

  [[nodiscard]] std::size_t next_index(std::size_t count) override {
    return static_cast<std::size_t>(rng_.below(static_cast<std::uint32_t>(count)));
  }

  void reseed(std::uint64_t seed) noexcept { rng_.reseed(seed); }

private:
  Pcg32 rng_;
};

} // namespace aquarium::sim

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace shardline {

/// Exponential reconnect delay with jitter, capped at a maximum.
///
/// The n-th call returns a delay in [base * (1 - jitter), base] where
/// base = min(max_delay, min_delay * multiplier^n).
class ExponentialBackoff {
public:
  struct Config {
    std::chrono::milliseconds min_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    double multiplier{2.0};
    double jitter{0.5};
  };

  ExponentialBackoff() : ExponentialBackoff(Config{}) {}
  explicit ExponentialBackoff(Config cfg,
                              std::uint64_t seed = std::random_device{}())
      : cfg_(cfg), rng_(seed) {}

  [[nodiscard]] auto next() -> std::chrono::milliseconds {
    auto base = static_cast<double>(cfg_.min_delay.count());
    const auto cap = static_cast<double>(cfg_.max_delay.count());
    for (int i = 0; i < attempts_ && base < cap; ++i) {
      base *= cfg_.multiplier;
    }
    base = std::min(base, cap);
    ++attempts_;

    const auto jitter = std::clamp(cfg_.jitter, 0.0, 1.0);
    if (jitter > 0.0 && base > 0.0) {
      std::uniform_real_distribution<double> dist(base * (1.0 - jitter), base);
      base = dist(rng_);
    }
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(base)};
  }

  void reset() { attempts_ = 0; }

  [[nodiscard]] auto attempts() const noexcept -> int { return attempts_; }
  [[nodiscard]] auto config() const noexcept -> const Config & { return cfg_; }

private:
  Config cfg_;
  std::mt19937_64 rng_;
  int attempts_ = 0;
};

} // namespace shardline

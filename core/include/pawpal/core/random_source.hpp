#pragma once

#include <cstdint>
#include <random>

#include "pawpal/core/services.hpp"

namespace pawpal::core {

class MersenneRandomSource final : public RandomSource {
 public:
  explicit MersenneRandomSource(std::uint32_t seed = std::random_device{}()) : engine_(seed) {}

  double NextUnit() override {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
  }

  int NextInt(int lo, int hi) override {
    if (hi < lo) {
      return lo;
    }
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine_);
  }

 private:
  std::mt19937 engine_;
};

}  // namespace pawpal::core

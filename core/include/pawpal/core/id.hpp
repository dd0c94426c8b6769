#pragma once

#include <cstdint>

namespace pawpal::core {

using TimerId = std::uint64_t;
constexpr TimerId kInvalidTimerId = 0;

class IdGenerator {
 public:
  explicit IdGenerator(TimerId next_id = 1) : next_id_(next_id) {}

  [[nodiscard]] TimerId next() { return next_id_++; }

  [[nodiscard]] TimerId peek() const { return next_id_; }

 private:
  TimerId next_id_ = 1;
};

}  // namespace pawpal::core

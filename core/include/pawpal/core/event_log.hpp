#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

namespace pawpal::core {

// Bounded in-memory log of tagged lines ("[walk] ...") shown by the diagnostics panel.
class EventLog {
 public:
  explicit EventLog(std::size_t capacity = 64) : capacity_(capacity == 0 ? 1 : capacity) {}

  void Push(std::string_view tag, std::string_view message);

  [[nodiscard]] const std::deque<std::string>& lines() const { return lines_; }
  [[nodiscard]] std::size_t total_pushed() const { return total_pushed_; }
  [[nodiscard]] bool contains(std::string_view fragment) const;
  void clear() { lines_.clear(); }

 private:
  std::size_t capacity_ = 64;
  std::size_t total_pushed_ = 0;
  std::deque<std::string> lines_{};
};

}  // namespace pawpal::core

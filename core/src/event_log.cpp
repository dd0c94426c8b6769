#include "pawpal/core/event_log.hpp"

#include <string>
#include <utility>

namespace pawpal::core {

void EventLog::Push(std::string_view tag, std::string_view message) {
  std::string line;
  line.reserve(tag.size() + message.size() + 3);
  line += '[';
  line += tag;
  line += "] ";
  line += message;
  lines_.push_back(std::move(line));
  ++total_pushed_;
  while (lines_.size() > capacity_) {
    lines_.pop_front();
  }
}

bool EventLog::contains(std::string_view fragment) const {
  for (const std::string& line : lines_) {
    if (line.find(fragment) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace pawpal::core

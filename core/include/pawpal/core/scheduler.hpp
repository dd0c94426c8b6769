#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>

#include "pawpal/core/id.hpp"

namespace pawpal::core {

// Single-threaded timer queue. Entries are ordered by (fire time, arming order) and fired
// by RunUntil(), which the host drives from its frame loop and tests drive with a
// virtual clock. Every callback runs to completion before the next one is considered.
class Scheduler {
 public:
  using Callback = std::function<void()>;

  explicit Scheduler(std::int64_t now_ms = 0) : now_ms_(now_ms) {}

  TimerId ScheduleOnce(std::int64_t delay_ms, Callback callback);
  TimerId ScheduleEvery(std::int64_t interval_ms, Callback callback);

  // Returns false when the id is unknown or already fired/cancelled.
  bool Cancel(TimerId id);
  // Cancels and resets the caller's handle to kInvalidTimerId.
  void CancelAndReset(TimerId& id);

  // Fires every entry due at or before now_ms. Virtual time steps to each fire time
  // while its callback runs. Returns the number of callbacks invoked.
  std::size_t RunUntil(std::int64_t now_ms);
  std::size_t Advance(std::int64_t delta_ms) { return RunUntil(now_ms_ + delta_ms); }

  [[nodiscard]] bool is_active(TimerId id) const { return entries_.find(id) != entries_.end(); }
  [[nodiscard]] std::optional<std::int64_t> fire_time(TimerId id) const;
  [[nodiscard]] std::optional<std::int64_t> next_due_ms() const;
  [[nodiscard]] std::size_t active_count() const { return entries_.size(); }
  [[nodiscard]] std::int64_t now_ms() const { return now_ms_; }

 private:
  struct TimerEntry {
    TimerId id = kInvalidTimerId;
    std::int64_t fire_ms = 0;
    std::int64_t interval_ms = 0;
    bool recurring = false;
    std::uint64_t sequence = 0;
    Callback callback{};
  };

  struct QueueItem {
    std::int64_t fire_ms = 0;
    std::uint64_t sequence = 0;
    TimerId id = kInvalidTimerId;

    bool operator>(const QueueItem& other) const {
      if (fire_ms != other.fire_ms) {
        return fire_ms > other.fire_ms;
      }
      return sequence > other.sequence;
    }
  };

  TimerId arm(std::int64_t delay_ms, std::int64_t interval_ms, bool recurring, Callback callback);
  void drop_stale_front();

  IdGenerator id_generator_{};
  std::uint64_t next_sequence_ = 1;
  std::int64_t now_ms_ = 0;
  std::unordered_map<TimerId, TimerEntry> entries_{};
  std::priority_queue<QueueItem, std::vector<QueueItem>, std::greater<QueueItem>> queue_{};
};

}  // namespace pawpal::core

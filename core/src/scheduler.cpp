#include "pawpal/core/scheduler.hpp"

#include <algorithm>
#include <utility>

namespace pawpal::core {

TimerId Scheduler::ScheduleOnce(std::int64_t delay_ms, Callback callback) {
  return arm(delay_ms, 0, false, std::move(callback));
}

TimerId Scheduler::ScheduleEvery(std::int64_t interval_ms, Callback callback) {
  // A zero period would never let RunUntil() return.
  const std::int64_t interval = std::max<std::int64_t>(1, interval_ms);
  return arm(interval, interval, true, std::move(callback));
}

TimerId Scheduler::arm(std::int64_t delay_ms, std::int64_t interval_ms, bool recurring, Callback callback) {
  TimerEntry entry{};
  entry.id = id_generator_.next();
  entry.fire_ms = now_ms_ + std::max<std::int64_t>(0, delay_ms);
  entry.interval_ms = interval_ms;
  entry.recurring = recurring;
  entry.sequence = next_sequence_++;
  entry.callback = std::move(callback);

  queue_.push({entry.fire_ms, entry.sequence, entry.id});
  const TimerId id = entry.id;
  entries_.emplace(id, std::move(entry));
  return id;
}

bool Scheduler::Cancel(TimerId id) {
  if (id == kInvalidTimerId) {
    return false;
  }
  // Queue items of cancelled entries are dropped lazily.
  return entries_.erase(id) > 0;
}

void Scheduler::CancelAndReset(TimerId& id) {
  (void)Cancel(id);
  id = kInvalidTimerId;
}

std::optional<std::int64_t> Scheduler::fire_time(TimerId id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.fire_ms;
}

void Scheduler::drop_stale_front() {
  while (!queue_.empty()) {
    const QueueItem& top = queue_.top();
    auto it = entries_.find(top.id);
    if (it != entries_.end() && it->second.sequence == top.sequence) {
      return;
    }
    queue_.pop();
  }
}

std::optional<std::int64_t> Scheduler::next_due_ms() const {
  std::optional<std::int64_t> due;
  for (const auto& [id, entry] : entries_) {
    if (!due.has_value() || entry.fire_ms < *due) {
      due = entry.fire_ms;
    }
  }
  return due;
}

std::size_t Scheduler::RunUntil(std::int64_t now_ms) {
  std::size_t fired = 0;
  while (true) {
    drop_stale_front();
    if (queue_.empty() || queue_.top().fire_ms > now_ms) {
      break;
    }
    const QueueItem item = queue_.top();
    queue_.pop();

    auto it = entries_.find(item.id);
    TimerEntry& entry = it->second;
    now_ms_ = std::max(now_ms_, item.fire_ms);

    Callback callback;
    if (entry.recurring) {
      // Re-arm first so the callback may cancel its own timer.
      entry.fire_ms = item.fire_ms + entry.interval_ms;
      entry.sequence = next_sequence_++;
      queue_.push({entry.fire_ms, entry.sequence, entry.id});
      callback = entry.callback;
    } else {
      callback = std::move(entry.callback);
      entries_.erase(it);
    }

    if (callback) {
      callback();
    }
    ++fired;
  }
  now_ms_ = std::max(now_ms_, now_ms);
  return fired;
}

}  // namespace pawpal::core

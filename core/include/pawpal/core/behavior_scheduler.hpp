#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pawpal/core/bubble_positioner.hpp"
#include "pawpal/core/config.hpp"
#include "pawpal/core/entities.hpp"
#include "pawpal/core/event_log.hpp"
#include "pawpal/core/id.hpp"
#include "pawpal/core/pet_state_machine.hpp"
#include "pawpal/core/scheduler.hpp"
#include "pawpal/core/services.hpp"
#include "pawpal/core/settings.hpp"
#include "pawpal/core/walk_controller.hpp"

namespace pawpal::core {

const std::vector<std::string>& encouragement_lines();
const std::vector<std::string>& rest_tips();

// Owns the behavior timers (rest reminder, snooze, chatter, auto roundtrip) and the
// roundtrip tracker. Each timer callback re-checks its idle predicate when it fires;
// a failed predicate is a silent no-op.
class BehaviorScheduler {
 public:
  BehaviorScheduler(PetModel& model,
                    Scheduler& scheduler,
                    PetStateMachine& state_machine,
                    WalkController& walker,
                    BubblePositioner& bubble,
                    const PetWindow& window,
                    SettingsStore& settings,
                    RandomSource& random,
                    EventLog& log,
                    BehaviorConfig config = {});
  ~BehaviorScheduler();

  BehaviorScheduler(const BehaviorScheduler&) = delete;
  BehaviorScheduler& operator=(const BehaviorScheduler&) = delete;

  // Arms every enabled behavior from the current flags.
  void Start();

  void ApplyRestState();
  void ApplyChatterState();
  void ApplyAutoRoundtripState();
  CommandResult ToggleRest();
  CommandResult ToggleChatter();
  CommandResult ToggleAutoRoundtrip();

  CommandResult SnoozeRest(int minutes);
  void FireRestReminder();
  void ResumeRestAfterSnooze();
  void FireChatter();
  void FireAutoRoundtrip();

  // direction 0 picks a random side. Refusals are silent and reported through the result.
  CommandResult StartRoundtrip(int direction, bool announce);
  // User-triggered variant: refusals surface a short notice.
  CommandResult RequestRoundtrip(int direction);
  void HandleEdgeHit();

  [[nodiscard]] bool ChatterIdle() const;
  [[nodiscard]] bool AutoRoundtripIdle() const;
  [[nodiscard]] std::string RandomEncouragement();

  [[nodiscard]] TimerId rest_timer() const { return rest_timer_; }
  [[nodiscard]] TimerId snooze_timer() const { return snooze_timer_; }
  [[nodiscard]] TimerId rest_pose_timer() const { return rest_pose_timer_; }
  [[nodiscard]] TimerId chatter_timer() const { return chatter_timer_; }
  [[nodiscard]] TimerId auto_roundtrip_timer() const { return auto_roundtrip_timer_; }
  [[nodiscard]] const BehaviorConfig& config() const { return config_; }

 private:
  void schedule_next_chatter();
  void finish_roundtrip();
  void return_from_rest_pose();
  [[nodiscard]] std::int64_t rest_interval_ms() const;
  [[nodiscard]] const char* roundtrip_refusal() const;

  PetModel& model_;
  Scheduler& scheduler_;
  PetStateMachine& state_machine_;
  WalkController& walker_;
  BubblePositioner& bubble_;
  const PetWindow& window_;
  SettingsStore& settings_;
  RandomSource& random_;
  EventLog& log_;
  BehaviorConfig config_{};

  TimerId rest_timer_ = kInvalidTimerId;
  TimerId snooze_timer_ = kInvalidTimerId;
  TimerId rest_pose_timer_ = kInvalidTimerId;
  TimerId chatter_timer_ = kInvalidTimerId;
  TimerId auto_roundtrip_timer_ = kInvalidTimerId;
};

}  // namespace pawpal::core

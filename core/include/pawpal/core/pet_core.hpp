#pragma once

#include <cstddef>
#include <cstdint>

#include "pawpal/core/behavior_scheduler.hpp"
#include "pawpal/core/bubble_positioner.hpp"
#include "pawpal/core/config.hpp"
#include "pawpal/core/drag_controller.hpp"
#include "pawpal/core/entities.hpp"
#include "pawpal/core/event_log.hpp"
#include "pawpal/core/pet_state_machine.hpp"
#include "pawpal/core/pomodoro_timer.hpp"
#include "pawpal/core/scheduler.hpp"
#include "pawpal/core/services.hpp"
#include "pawpal/core/settings.hpp"
#include "pawpal/core/walk_controller.hpp"

namespace pawpal::core {

// Owns the pet model and every behavior component. The host feeds it commands,
// pointer events and the current time; nothing here blocks or spawns threads.
class PetCore {
 public:
  PetCore(const ScreenGeometryProvider& screens,
          PetWindow& window,
          const TextMeasurer& measurer,
          SettingsStore& settings,
          RandomSource& random,
          const PetConfig& config = {},
          std::int64_t start_ms = 0);

  PetCore(const PetCore&) = delete;
  PetCore& operator=(const PetCore&) = delete;

  // Reads persisted state, loads every animation and arms the behaviors. A missing
  // animation asset fails initialization; nothing is armed in that case.
  OpResult<bool> Initialize(AnimationLoader& loader, const AssetPaths& paths);

  CommandResult Dispatch(const CommandRequest& request);
  CommandResult Dispatch(Command command);

  // Fires every timer due at or before now_ms (absolute, same clock as the constructor).
  std::size_t RunUntil(std::int64_t now_ms);
  std::size_t Advance(std::int64_t delta_ms);

  PointerOutcome OnPointerPress(PointerButton button, const Point& global, std::int64_t now_ms);
  PointerOutcome OnPointerMove(const Point& global);
  PointerOutcome OnPointerRelease(PointerButton button, const Point& global, std::int64_t now_ms);
  void OnDoubleClick();
  void OnWheel(float steps);

  [[nodiscard]] bool initialized() const { return initialized_; }
  [[nodiscard]] bool quit_requested() const { return model_.quit_requested; }
  [[nodiscard]] const PetModel& model() const { return model_; }
  [[nodiscard]] const PetConfig& config() const { return config_; }
  [[nodiscard]] const EventLog& log() const { return log_; }
  [[nodiscard]] Scheduler& scheduler() { return scheduler_; }
  [[nodiscard]] const BubblePositioner& bubble() const { return bubble_; }
  [[nodiscard]] const WalkController& walker() const { return walker_; }
  [[nodiscard]] const PetStateMachine& state_machine() const { return state_machine_; }
  [[nodiscard]] PetStateMachine& state_machine() { return state_machine_; }
  [[nodiscard]] const PomodoroTimer& pomodoro() const { return pomodoro_; }
  [[nodiscard]] PomodoroTimer& pomodoro() { return pomodoro_; }
  [[nodiscard]] BehaviorScheduler& behavior() { return behavior_; }
  [[nodiscard]] const DragController& drag() const { return drag_; }
  [[nodiscard]] const PetWindow& window() const { return window_; }

 private:
  void load_persisted_state();
  void restore_position();
  CommandResult set_scale(double scale);
  CommandResult toggle_lock();
  void persist();

  const ScreenGeometryProvider& screens_;
  PetWindow& window_;
  SettingsStore& settings_;
  PetConfig config_{};

  PetModel model_{};
  EventLog log_{};
  Scheduler scheduler_;
  BubblePositioner bubble_;
  WalkController walker_;
  PetStateMachine state_machine_;
  PomodoroTimer pomodoro_;
  BehaviorScheduler behavior_;
  DragController drag_;
  bool initialized_ = false;
};

}  // namespace pawpal::core

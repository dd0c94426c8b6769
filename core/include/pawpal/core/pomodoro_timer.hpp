#pragma once

#include <string>

#include "pawpal/core/bubble_positioner.hpp"
#include "pawpal/core/config.hpp"
#include "pawpal/core/entities.hpp"
#include "pawpal/core/event_log.hpp"
#include "pawpal/core/id.hpp"
#include "pawpal/core/pet_state_machine.hpp"
#include "pawpal/core/scheduler.hpp"

namespace pawpal::core {

std::string format_mmss(int seconds);

// Work/break countdown ticking once per second. Writes PetModel::pomodoro.
class PomodoroTimer {
 public:
  PomodoroTimer(PetModel& model,
                Scheduler& scheduler,
                PetStateMachine& state_machine,
                BubblePositioner& bubble,
                EventLog& log,
                PomodoroConfig config = {},
                int snooze_minutes = 10);
  ~PomodoroTimer();

  PomodoroTimer(const PomodoroTimer&) = delete;
  PomodoroTimer& operator=(const PomodoroTimer&) = delete;

  CommandResult Start();
  CommandResult Stop();
  CommandResult ForceBreak();
  CommandResult ForceWork();
  void Tick();

  // "Focus: 24:59 remaining", empty when stopped.
  [[nodiscard]] std::string CountdownLine() const;

  [[nodiscard]] const PomodoroState& state() const { return model_.pomodoro; }
  [[nodiscard]] bool running() const { return model_.pomodoro.running; }
  [[nodiscard]] TimerId tick_timer() const { return tick_timer_; }
  [[nodiscard]] const PomodoroConfig& config() const { return config_; }

 private:
  void enter_mode(PomodoroMode mode);
  void show_countdown_bubble();

  PetModel& model_;
  Scheduler& scheduler_;
  PetStateMachine& state_machine_;
  BubblePositioner& bubble_;
  EventLog& log_;
  PomodoroConfig config_{};
  int snooze_minutes_ = 10;
  TimerId tick_timer_ = kInvalidTimerId;
};

}  // namespace pawpal::core

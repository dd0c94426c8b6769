#include "pawpal/core/pomodoro_timer.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pawpal::core {

namespace {

constexpr int kNoticeMs = 1800;
constexpr int kTransitionMs = 2600;

}  // namespace

std::string format_mmss(int seconds) {
  const int clamped = std::max(0, seconds);
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d", clamped / 60, clamped % 60);
  return buffer;
}

PomodoroTimer::PomodoroTimer(PetModel& model,
                             Scheduler& scheduler,
                             PetStateMachine& state_machine,
                             BubblePositioner& bubble,
                             EventLog& log,
                             PomodoroConfig config,
                             int snooze_minutes)
    : model_(model),
      scheduler_(scheduler),
      state_machine_(state_machine),
      bubble_(bubble),
      log_(log),
      config_(config),
      snooze_minutes_(snooze_minutes) {}

PomodoroTimer::~PomodoroTimer() { scheduler_.CancelAndReset(tick_timer_); }

CommandResult PomodoroTimer::Start() {
  if (model_.pomodoro.running) {
    bubble_.Announce("Pomodoro", "Already running.", kNoticeMs);
    return {CommandStatus::kNoOp, "pomodoro already running"};
  }
  model_.pomodoro.running = true;
  enter_mode(PomodoroMode::kWork);
  scheduler_.CancelAndReset(tick_timer_);
  tick_timer_ = scheduler_.ScheduleEvery(1000, [this]() { Tick(); });
  log_.Push("pomodoro", "started work=" + std::to_string(config_.work_seconds) + "s");
  show_countdown_bubble();
  return {};
}

CommandResult PomodoroTimer::Stop() {
  scheduler_.CancelAndReset(tick_timer_);
  const bool was_running = model_.pomodoro.running;
  model_.pomodoro.running = false;
  if (was_running) {
    log_.Push("pomodoro", "stopped");
  }
  bubble_.Announce("Pomodoro", "Stopped.", 2000);
  return {};
}

CommandResult PomodoroTimer::ForceBreak() {
  if (!model_.pomodoro.running) {
    bubble_.Announce("Pomodoro", "Start it first.", kNoticeMs);
    return {CommandStatus::kNoOp, "pomodoro not running"};
  }
  enter_mode(PomodoroMode::kBreak);
  bubble_.Announce("Break", "Starting break now.", kNoticeMs);
  show_countdown_bubble();
  return {};
}

CommandResult PomodoroTimer::ForceWork() {
  if (!model_.pomodoro.running) {
    bubble_.Announce("Pomodoro", "Start it first.", kNoticeMs);
    return {CommandStatus::kNoOp, "pomodoro not running"};
  }
  enter_mode(PomodoroMode::kWork);
  bubble_.Announce("Focus", "Back to work.", kNoticeMs);
  show_countdown_bubble();
  return {};
}

void PomodoroTimer::Tick() {
  if (!model_.pomodoro.running) {
    return;
  }
  model_.pomodoro.seconds_remaining = std::max(0, model_.pomodoro.seconds_remaining - 1);
  if (model_.pomodoro.seconds_remaining <= 0) {
    if (model_.pomodoro.mode == PomodoroMode::kWork) {
      enter_mode(PomodoroMode::kBreak);
      bubble_.Announce("Time's up", "Nice work. Break time starts now.", kTransitionMs);
    } else {
      enter_mode(PomodoroMode::kWork);
      bubble_.Announce("Time's up", "Break over. Back to focus.", kTransitionMs);
    }
    show_countdown_bubble();
  }
  bubble_.FollowTrackedWindow();
}

std::string PomodoroTimer::CountdownLine() const {
  if (!model_.pomodoro.running) {
    return {};
  }
  const char* label = model_.pomodoro.mode == PomodoroMode::kWork ? "Focus" : "Break";
  return std::string(label) + ": " + format_mmss(model_.pomodoro.seconds_remaining) + " remaining";
}

void PomodoroTimer::enter_mode(PomodoroMode mode) {
  model_.pomodoro.mode = mode;
  if (mode == PomodoroMode::kWork) {
    model_.pomodoro.seconds_remaining = config_.work_seconds;
    (void)state_machine_.SetState(PoseState::kSitting);
  } else {
    model_.pomodoro.seconds_remaining = config_.break_seconds;
    (void)state_machine_.SetState(PoseState::kLyingDown);
  }
  log_.Push("pomodoro", std::string("mode ") + pomodoro_mode_label(mode));
}

void PomodoroTimer::show_countdown_bubble() {
  if (!model_.pomodoro.running) {
    return;
  }
  CommandRequest snooze{};
  snooze.command = Command::kSnoozeRest;
  snooze.minutes = snooze_minutes_;
  const std::string snooze_label = "Snooze " + std::to_string(snooze_minutes_) + " min";

  std::vector<BubbleButton> buttons;
  std::string title;
  std::string message;
  if (model_.pomodoro.mode == PomodoroMode::kWork) {
    title = "Focus time";
    message = "Write one small piece: one sentence or one citation.";
    buttons.push_back({"Start break", CommandRequest{Command::kPomodoroForceBreak}});
  } else {
    title = "Break time";
    message = "Stand up. Stretch your neck & shoulders.";
    buttons.push_back({"Back to focus", CommandRequest{Command::kPomodoroForceWork}});
  }
  buttons.push_back({snooze_label, snooze});

  DynamicTextSource countdown = [this]() -> std::optional<std::string> {
    if (!model_.pomodoro.running) {
      return std::nullopt;
    }
    return CountdownLine();
  };
  bubble_.Announce(title, message, 0, std::move(buttons), std::move(countdown), 1000);
}

}  // namespace pawpal::core

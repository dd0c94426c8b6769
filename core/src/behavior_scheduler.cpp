#include "pawpal/core/behavior_scheduler.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace pawpal::core {

namespace {

constexpr int kToggleNoticeMs = 2200;

const char* on_off(bool value) {
  return value ? "ON" : "OFF";
}

}  // namespace

const std::vector<std::string>& encouragement_lines() {
  static const std::vector<std::string> lines = {
      "Write one sentence. That's progress.",
      "Draft first, polish later.",
      "Keep it simple: one paragraph at a time.",
      "Cite as you go. Future you will thank you.",
      "If it feels hard, shrink the task.",
      "Save your work. Ctrl+S ;)",
  };
  return lines;
}

const std::vector<std::string>& rest_tips() {
  static const std::vector<std::string> tips = {
      "Time to stretch. Relax your shoulders.",
      "Hydration check. Take a sip of water.",
      "Look 20 seconds at something far away.",
      "Stand up for 30 seconds. Your neck will thank you.",
  };
  return tips;
}

BehaviorScheduler::BehaviorScheduler(PetModel& model,
                                     Scheduler& scheduler,
                                     PetStateMachine& state_machine,
                                     WalkController& walker,
                                     BubblePositioner& bubble,
                                     const PetWindow& window,
                                     SettingsStore& settings,
                                     RandomSource& random,
                                     EventLog& log,
                                     BehaviorConfig config)
    : model_(model),
      scheduler_(scheduler),
      state_machine_(state_machine),
      walker_(walker),
      bubble_(bubble),
      window_(window),
      settings_(settings),
      random_(random),
      log_(log),
      config_(config) {
  walker_.SetEdgeHandler([this]() { HandleEdgeHit(); });
}

BehaviorScheduler::~BehaviorScheduler() {
  walker_.SetEdgeHandler({});
  scheduler_.CancelAndReset(rest_timer_);
  scheduler_.CancelAndReset(snooze_timer_);
  scheduler_.CancelAndReset(rest_pose_timer_);
  scheduler_.CancelAndReset(chatter_timer_);
  scheduler_.CancelAndReset(auto_roundtrip_timer_);
}

void BehaviorScheduler::Start() {
  ApplyChatterState();
  ApplyRestState();
  ApplyAutoRoundtripState();
}

std::int64_t BehaviorScheduler::rest_interval_ms() const {
  return static_cast<std::int64_t>(std::max(1, model_.rest_interval_minutes)) * 60 * 1000;
}

// ---------------------------------------------------------------------------
// Rest reminder and snooze

void BehaviorScheduler::ApplyRestState() {
  scheduler_.CancelAndReset(snooze_timer_);
  scheduler_.CancelAndReset(rest_timer_);
  if (model_.flags.rest_enabled) {
    rest_timer_ = scheduler_.ScheduleEvery(rest_interval_ms(), [this]() {
      if (model_.flags.rest_enabled) {
        FireRestReminder();
      }
    });
  }
}

CommandResult BehaviorScheduler::ToggleRest() {
  model_.flags.rest_enabled = !model_.flags.rest_enabled;
  settings_.SetBool(settings_keys::kRestEnabled, model_.flags.rest_enabled);
  ApplyRestState();
  log_.Push("rest", std::string("reminder ") + on_off(model_.flags.rest_enabled));
  bubble_.Announce("Rest reminder", on_off(model_.flags.rest_enabled), kToggleNoticeMs);
  return {};
}

CommandResult BehaviorScheduler::SnoozeRest(int minutes) {
  if (minutes <= 0) {
    bubble_.Announce("Snooze", "Pick at least one minute.", kToggleNoticeMs);
    return {CommandStatus::kNoOp, "snooze minutes must be > 0"};
  }
  scheduler_.CancelAndReset(rest_timer_);
  scheduler_.CancelAndReset(snooze_timer_);
  snooze_timer_ = scheduler_.ScheduleOnce(static_cast<std::int64_t>(minutes) * 60 * 1000, [this]() {
    snooze_timer_ = kInvalidTimerId;
    ResumeRestAfterSnooze();
  });
  log_.Push("rest", "snoozed " + std::to_string(minutes) + " min");
  bubble_.Announce("Snoozed", "Rest reminder paused for " + std::to_string(minutes) + " min.", 2400);
  return {};
}

void BehaviorScheduler::ResumeRestAfterSnooze() {
  scheduler_.CancelAndReset(snooze_timer_);
  if (!model_.flags.rest_enabled) {
    return;
  }
  scheduler_.CancelAndReset(rest_timer_);
  rest_timer_ = scheduler_.ScheduleEvery(rest_interval_ms(), [this]() {
    if (model_.flags.rest_enabled) {
      FireRestReminder();
    }
  });
  log_.Push("rest", "resumed after snooze");
}

void BehaviorScheduler::FireRestReminder() {
  // Rest wins over a walk in progress, wherever it is.
  if (model_.roundtrip.active) {
    log_.Push("rest", "preempting roundtrip");
  }
  model_.roundtrip = RoundtripWalk{};
  (void)state_machine_.SetState(PoseState::kLyingDown);

  scheduler_.CancelAndReset(rest_pose_timer_);
  rest_pose_timer_ = scheduler_.ScheduleOnce(config_.rest_pose_ms, [this]() {
    rest_pose_timer_ = kInvalidTimerId;
    return_from_rest_pose();
  });

  const auto& tips = rest_tips();
  const std::string& tip = tips[static_cast<std::size_t>(random_.NextInt(0, static_cast<int>(tips.size()) - 1))];
  CommandRequest snooze{};
  snooze.command = Command::kSnoozeRest;
  snooze.minutes = config_.snooze_minutes;
  std::vector<BubbleButton> buttons;
  buttons.push_back({"Snooze " + std::to_string(config_.snooze_minutes) + " min", snooze});
  log_.Push("rest", "reminder fired");
  bubble_.Announce("Rest time", tip, 0, std::move(buttons));
}

void BehaviorScheduler::return_from_rest_pose() {
  // A pomodoro break keeps the pet lying down until the pomodoro says otherwise.
  if (model_.pose != PoseState::kLyingDown) {
    return;
  }
  if (model_.pomodoro.running && model_.pomodoro.mode == PomodoroMode::kBreak) {
    return;
  }
  (void)state_machine_.SetState(PoseState::kSitting);
}

// ---------------------------------------------------------------------------
// Chatter

void BehaviorScheduler::ApplyChatterState() {
  if (model_.flags.chatter_enabled) {
    schedule_next_chatter();
  } else {
    scheduler_.CancelAndReset(chatter_timer_);
  }
}

CommandResult BehaviorScheduler::ToggleChatter() {
  model_.flags.chatter_enabled = !model_.flags.chatter_enabled;
  settings_.SetBool(settings_keys::kChatterEnabled, model_.flags.chatter_enabled);
  ApplyChatterState();
  log_.Push("chatter", on_off(model_.flags.chatter_enabled));
  bubble_.Announce("Random chatter", on_off(model_.flags.chatter_enabled), kToggleNoticeMs);
  return {};
}

void BehaviorScheduler::schedule_next_chatter() {
  scheduler_.CancelAndReset(chatter_timer_);
  const int delay = random_.NextInt(config_.chatter_min_ms, config_.chatter_max_ms);
  chatter_timer_ = scheduler_.ScheduleOnce(delay, [this]() {
    chatter_timer_ = kInvalidTimerId;
    FireChatter();
  });
}

bool BehaviorScheduler::ChatterIdle() const {
  return model_.flags.chatter_enabled && window_.visible() && !model_.flags.dragging;
}

void BehaviorScheduler::FireChatter() {
  if (ChatterIdle() && random_.NextUnit() < config_.chatter_probability) {
    bubble_.Announce("Keep going", RandomEncouragement(), 2600);
  }
  if (model_.flags.chatter_enabled) {
    schedule_next_chatter();
  } else {
    scheduler_.CancelAndReset(chatter_timer_);
  }
}

std::string BehaviorScheduler::RandomEncouragement() {
  const auto& lines = encouragement_lines();
  return lines[static_cast<std::size_t>(random_.NextInt(0, static_cast<int>(lines.size()) - 1))];
}

// ---------------------------------------------------------------------------
// Roundtrip walks

void BehaviorScheduler::ApplyAutoRoundtripState() {
  scheduler_.CancelAndReset(auto_roundtrip_timer_);
  if (model_.flags.auto_roundtrip_enabled) {
    auto_roundtrip_timer_ = scheduler_.ScheduleEvery(config_.auto_roundtrip_ms, [this]() { FireAutoRoundtrip(); });
  }
}

CommandResult BehaviorScheduler::ToggleAutoRoundtrip() {
  model_.flags.auto_roundtrip_enabled = !model_.flags.auto_roundtrip_enabled;
  settings_.SetBool(settings_keys::kAutoRoundtripEnabled, model_.flags.auto_roundtrip_enabled);
  ApplyAutoRoundtripState();
  log_.Push("walk", std::string("auto roundtrip ") + on_off(model_.flags.auto_roundtrip_enabled));
  bubble_.Announce("Auto walk", on_off(model_.flags.auto_roundtrip_enabled), kToggleNoticeMs);
  return {};
}

bool BehaviorScheduler::AutoRoundtripIdle() const {
  if (!model_.flags.auto_roundtrip_enabled || model_.flags.dragging || model_.pomodoro.running) {
    return false;
  }
  return model_.pose != PoseState::kLyingDown && !is_walking(model_.pose);
}

void BehaviorScheduler::FireAutoRoundtrip() {
  if (!AutoRoundtripIdle()) {
    return;
  }
  (void)StartRoundtrip(0, false);
  if (model_.roundtrip.active) {
    bubble_.Announce("Auto walk", "30 mins, let's take a walk~", 2400);
  }
}

const char* BehaviorScheduler::roundtrip_refusal() const {
  if (model_.flags.dragging) {
    return "Let go of me first.";
  }
  if (model_.pose == PoseState::kLyingDown) {
    return "I'm resting right now.";
  }
  if (model_.pomodoro.running) {
    return "Not during a pomodoro.";
  }
  if (is_walking(model_.pose)) {
    return "Already walking.";
  }
  return nullptr;
}

CommandResult BehaviorScheduler::StartRoundtrip(int direction, bool announce) {
  if (const char* refusal = roundtrip_refusal(); refusal != nullptr) {
    return {CommandStatus::kNoOp, refusal};
  }

  int dir = direction;
  if (dir == 0) {
    dir = random_.NextInt(0, 1) == 0 ? -1 : +1;
  }
  dir = dir < 0 ? -1 : +1;
  const PoseState pose = walking_pose_for(dir);
  if (!state_machine_.has_animation(pose)) {
    return {CommandStatus::kError, "walking animation not loaded"};
  }

  model_.roundtrip.direction = dir;
  model_.roundtrip.edge_hits_remaining = 2;  // first edge, then the opposite one
  model_.roundtrip.active = true;
  (void)state_machine_.SetState(pose);
  log_.Push("walk", std::string("roundtrip started dir=") + (dir < 0 ? "-1" : "+1"));

  if (announce) {
    bubble_.Announce("Walk", "I'm going all the way to the side", 2600);
  }
  return {};
}

CommandResult BehaviorScheduler::RequestRoundtrip(int direction) {
  CommandResult result = StartRoundtrip(direction, true);
  if (result.status == CommandStatus::kNoOp) {
    bubble_.Announce("Walk", result.message, 2000);
  }
  return result;
}

void BehaviorScheduler::HandleEdgeHit() {
  if (!model_.roundtrip.active) {
    return;
  }
  --model_.roundtrip.edge_hits_remaining;
  if (model_.roundtrip.edge_hits_remaining <= 0) {
    finish_roundtrip();
    return;
  }
  model_.roundtrip.direction = walker_.direction() < 0 ? +1 : -1;
  (void)state_machine_.SetState(walking_pose_for(model_.roundtrip.direction));
  log_.Push("walk", "reversed, edges left=" + std::to_string(model_.roundtrip.edge_hits_remaining));
}

void BehaviorScheduler::finish_roundtrip() {
  model_.roundtrip = RoundtripWalk{};
  walker_.Stop();
  (void)state_machine_.SetState(PoseState::kSitting);
  log_.Push("walk", "roundtrip finished");
  bubble_.Announce("Walk finished", "back to study~", 2200);
}

}  // namespace pawpal::core

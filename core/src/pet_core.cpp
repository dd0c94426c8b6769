#include "pawpal/core/pet_core.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "pawpal/core/window_placement.hpp"

namespace pawpal::core {

namespace {

bool is_scale_preset(double scale) {
  for (double preset : kScalePresets) {
    if (std::fabs(preset - scale) < 1e-6) {
      return true;
    }
  }
  return false;
}

}  // namespace

PetCore::PetCore(const ScreenGeometryProvider& screens,
                 PetWindow& window,
                 const TextMeasurer& measurer,
                 SettingsStore& settings,
                 RandomSource& random,
                 const PetConfig& config,
                 std::int64_t start_ms)
    : screens_(screens),
      window_(window),
      settings_(settings),
      config_(config),
      scheduler_(start_ms),
      bubble_(scheduler_, screens, measurer, log_, config.bubble),
      walker_(scheduler_, window, screens, bubble_, model_.flags, log_, config.walk),
      state_machine_(model_, window, screens, walker_, bubble_, log_, config.animation),
      pomodoro_(model_, scheduler_, state_machine_, bubble_, log_, config.pomodoro, config.behavior.snooze_minutes),
      behavior_(model_, scheduler_, state_machine_, walker_, bubble_, window, settings, random, log_, config.behavior),
      drag_(model_.flags, window, screens, bubble_, settings, log_, config.drag) {
  bubble_.Track(&window_);
}

OpResult<bool> PetCore::Initialize(AnimationLoader& loader, const AssetPaths& paths) {
  OpResult<bool> result;
  if (initialized_) {
    result.error = "already initialized";
    return result;
  }

  load_persisted_state();

  const auto loaded = state_machine_.LoadAnimations(loader, paths);
  if (!loaded.ok) {
    result.error = loaded.error;
    return result;
  }

  restore_position();
  (void)state_machine_.SetState(PoseState::kSitting);
  behavior_.Start();

  // The host may still be settling its window; re-check placement shortly after start.
  (void)scheduler_.ScheduleOnce(config_.startup.ensure_on_screen_delay_ms, [this]() {
    (void)EnsureOnScreen(window_, screens_);
    bubble_.FollowTrackedWindow();
  });
  (void)scheduler_.ScheduleOnce(config_.startup.hello_delay_ms,
                                [this]() { bubble_.Announce("Hello", "I'm doei", config_.bubble.default_duration_ms); });

  initialized_ = true;
  log_.Push("info", "pet initialized");
  result.ok = true;
  result.value = true;
  return result;
}

void PetCore::load_persisted_state() {
  ActivityFlags& flags = model_.flags;
  flags.locked = settings_.GetBool(settings_keys::kLocked, false);
  flags.chatter_enabled = settings_.GetBool(settings_keys::kChatterEnabled, true);
  flags.rest_enabled = settings_.GetBool(settings_keys::kRestEnabled, true);
  flags.auto_roundtrip_enabled = settings_.GetBool(settings_keys::kAutoRoundtripEnabled, true);
  model_.rest_interval_minutes = std::max(1, settings_.GetInt(settings_keys::kRestIntervalMinutes, 50));
  model_.scale = settings_.GetDouble(settings_keys::kScale, 1.0);
  log_.Push("settings", "loaded locked=" + std::to_string(flags.locked) +
                            " chatter=" + std::to_string(flags.chatter_enabled) +
                            " rest=" + std::to_string(flags.rest_enabled) +
                            " auto_walk=" + std::to_string(flags.auto_roundtrip_enabled));
}

void PetCore::restore_position() {
  const Point fallback = config_.startup.default_position;
  const Point restored{settings_.GetInt(settings_keys::kPosX, fallback.x),
                       settings_.GetInt(settings_keys::kPosY, fallback.y)};
  window_.Move(restored);
}

CommandResult PetCore::Dispatch(Command command) {
  CommandRequest request{};
  request.command = command;
  if (command == Command::kSnoozeRest) {
    request.minutes = config_.behavior.snooze_minutes;
  }
  return Dispatch(request);
}

CommandResult PetCore::Dispatch(const CommandRequest& request) {
  CommandResult result{};
  switch (request.command) {
  case Command::kShow:
    window_.SetVisible(true);
    bubble_.FollowTrackedWindow();
    break;
  case Command::kHide:
    window_.SetVisible(false);
    bubble_.Hide();
    break;
  case Command::kToggleVisible:
    return Dispatch(window_.visible() ? Command::kHide : Command::kShow);
  case Command::kSitFocus:
    if (!state_machine_.SetState(PoseState::kSitting, true, "Focus", behavior_.RandomEncouragement())) {
      result = {CommandStatus::kError, "sitting animation not loaded"};
    }
    break;
  case Command::kLieDownBreak:
    if (!state_machine_.SetState(PoseState::kLyingDown, true, "Break", "Take 60 seconds. Roll your shoulders.")) {
      result = {CommandStatus::kError, "lying animation not loaded"};
    }
    break;
  case Command::kMotivate:
    bubble_.Announce("Keep going", behavior_.RandomEncouragement(), 2400);
    break;
  case Command::kWalkRoundtrip:
    result = behavior_.RequestRoundtrip(request.direction);
    break;
  case Command::kStartPomodoro:
    result = pomodoro_.Start();
    break;
  case Command::kStopPomodoro:
    result = pomodoro_.Stop();
    break;
  case Command::kPomodoroForceBreak:
    result = pomodoro_.ForceBreak();
    break;
  case Command::kPomodoroForceWork:
    result = pomodoro_.ForceWork();
    break;
  case Command::kSnoozeRest:
    result = behavior_.SnoozeRest(request.minutes);
    break;
  case Command::kToggleAutoRoundtrip:
    result = behavior_.ToggleAutoRoundtrip();
    break;
  case Command::kToggleRest:
    result = behavior_.ToggleRest();
    break;
  case Command::kToggleChatter:
    result = behavior_.ToggleChatter();
    break;
  case Command::kToggleLock:
    result = toggle_lock();
    break;
  case Command::kSetScale:
    result = set_scale(request.scale);
    break;
  case Command::kCloseBubble:
    bubble_.Close();
    break;
  case Command::kQuit:
    model_.quit_requested = true;
    break;
  default:
    result = {CommandStatus::kError, "unknown command"};
    break;
  }

  std::string line = command_label(request.command);
  if (!result.message.empty()) {
    line += ": " + result.message;
  }
  log_.Push("cmd", line);
  persist();
  return result;
}

CommandResult PetCore::toggle_lock() {
  model_.flags.locked = !model_.flags.locked;
  settings_.SetBool(settings_keys::kLocked, model_.flags.locked);
  bubble_.Announce("Lock", model_.flags.locked ? "Locked (no dragging)" : "Unlocked (dragging enabled)", 2400);
  return {};
}

CommandResult PetCore::set_scale(double scale) {
  if (!is_scale_preset(scale)) {
    bubble_.Announce("Scale", "Pick 50%, 75%, 100% or 125%.", 2200);
    return {CommandStatus::kError, "unsupported scale " + std::to_string(scale)};
  }
  const double applied = state_machine_.ApplyScale(scale);
  settings_.SetDouble(settings_keys::kScale, applied);
  return {};
}

std::size_t PetCore::RunUntil(std::int64_t now_ms) {
  return scheduler_.RunUntil(now_ms);
}

std::size_t PetCore::Advance(std::int64_t delta_ms) {
  return scheduler_.Advance(delta_ms);
}

PointerOutcome PetCore::OnPointerPress(PointerButton button, const Point& global, std::int64_t now_ms) {
  return drag_.Press(button, global, now_ms);
}

PointerOutcome PetCore::OnPointerMove(const Point& global) {
  return drag_.Move(global);
}

PointerOutcome PetCore::OnPointerRelease(PointerButton button, const Point& global, std::int64_t now_ms) {
  const PointerOutcome outcome = drag_.Release(button, global, now_ms);
  switch (outcome) {
  case PointerOutcome::kClick:
    bubble_.Announce("Focus", behavior_.RandomEncouragement(), 2400);
    persist();
    break;
  case PointerOutcome::kDragEnded:
    persist();
    break;
  case PointerOutcome::kLockedClick:
    bubble_.Announce("Locked", "Right click to unlock.", 2200);
    break;
  default:
    break;
  }
  return outcome;
}

void PetCore::OnDoubleClick() {
  if (model_.pose == PoseState::kSitting) {
    (void)state_machine_.SetState(PoseState::kLyingDown, true, "Break", "Quick break. Breathe in, breathe out.");
  } else {
    (void)state_machine_.SetState(PoseState::kSitting, true, "Focus", "Back to it. One small step.");
  }
}

void PetCore::OnWheel(float steps) {
  if (!state_machine_.uniform_base_size().has_value() || steps == 0.0f) {
    return;
  }
  const double factor = steps > 0.0f ? config_.animation.wheel_step : 1.0 / config_.animation.wheel_step;
  const double applied = state_machine_.ApplyScale(model_.scale * factor);
  settings_.SetDouble(settings_keys::kScale, applied);
  persist();
}

void PetCore::persist() {
  const auto flushed = settings_.Flush();
  if (!flushed.ok) {
    log_.Push("error", flushed.error);
  }
}

}  // namespace pawpal::core

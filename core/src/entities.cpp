#include "pawpal/core/entities.hpp"

namespace pawpal::core {

const char* pose_label(PoseState pose) {
  switch (pose) {
  case PoseState::kSitting:
    return "Sitting";
  case PoseState::kLyingDown:
    return "LyingDown";
  case PoseState::kWalkingLeft:
    return "WalkingLeft";
  case PoseState::kWalkingRight:
    return "WalkingRight";
  default:
    return "Unknown";
  }
}

const char* pomodoro_mode_label(PomodoroMode mode) {
  switch (mode) {
  case PomodoroMode::kWork:
    return "Work";
  case PomodoroMode::kBreak:
    return "Break";
  default:
    return "Unknown";
  }
}

const char* command_label(Command command) {
  switch (command) {
  case Command::kShow:
    return "Show";
  case Command::kHide:
    return "Hide";
  case Command::kToggleVisible:
    return "ToggleVisible";
  case Command::kSitFocus:
    return "SitFocus";
  case Command::kLieDownBreak:
    return "LieDownBreak";
  case Command::kMotivate:
    return "Motivate";
  case Command::kWalkRoundtrip:
    return "WalkRoundtrip";
  case Command::kStartPomodoro:
    return "StartPomodoro";
  case Command::kStopPomodoro:
    return "StopPomodoro";
  case Command::kPomodoroForceBreak:
    return "PomodoroForceBreak";
  case Command::kPomodoroForceWork:
    return "PomodoroForceWork";
  case Command::kSnoozeRest:
    return "SnoozeRest";
  case Command::kToggleAutoRoundtrip:
    return "ToggleAutoRoundtrip";
  case Command::kToggleRest:
    return "ToggleRest";
  case Command::kToggleChatter:
    return "ToggleChatter";
  case Command::kToggleLock:
    return "ToggleLock";
  case Command::kSetScale:
    return "SetScale";
  case Command::kCloseBubble:
    return "CloseBubble";
  case Command::kQuit:
    return "Quit";
  default:
    return "Unknown";
  }
}

}  // namespace pawpal::core

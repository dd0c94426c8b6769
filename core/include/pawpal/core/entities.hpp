#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "pawpal/core/types.hpp"

namespace pawpal::core {

enum class PoseState : std::uint8_t {
  kSitting = 0,
  kLyingDown = 1,
  kWalkingLeft = 2,
  kWalkingRight = 3,
};

constexpr std::size_t kPoseCount = 4;

constexpr std::array<PoseState, kPoseCount> kAllPoses = {
    PoseState::kSitting,
    PoseState::kLyingDown,
    PoseState::kWalkingLeft,
    PoseState::kWalkingRight,
};

inline bool is_walking(PoseState pose) {
  return pose == PoseState::kWalkingLeft || pose == PoseState::kWalkingRight;
}

inline PoseState walking_pose_for(int direction) {
  return direction < 0 ? PoseState::kWalkingLeft : PoseState::kWalkingRight;
}

enum class PomodoroMode : std::uint8_t {
  kWork = 0,
  kBreak = 1,
};

enum class AnchorMode : std::uint8_t {
  kHead = 0,
  kCenter = 1,
};

struct RoundtripWalk {
  int direction = 0;  // -1 left, +1 right, 0 none
  int edge_hits_remaining = 0;
  bool active = false;
};

struct PomodoroState {
  bool running = false;
  PomodoroMode mode = PomodoroMode::kWork;
  int seconds_remaining = 0;
};

struct ActivityFlags {
  bool dragging = false;
  bool locked = false;
  bool chatter_enabled = true;
  bool rest_enabled = true;
  bool auto_roundtrip_enabled = true;
};

// Shared mutable state of one pet. Every component receives it by reference; only the
// component named in the comment writes the field.
struct PetModel {
  PoseState pose = PoseState::kSitting;  // PetStateMachine
  RoundtripWalk roundtrip{};             // BehaviorScheduler (edge check in walk ticks)
  PomodoroState pomodoro{};              // PomodoroTimer
  ActivityFlags flags{};                 // DragController (dragging), toggles elsewhere
  int rest_interval_minutes = 50;
  double scale = 1.0;
  bool quit_requested = false;
};

enum class Command : std::uint8_t {
  kShow = 0,
  kHide = 1,
  kToggleVisible = 2,
  kSitFocus = 3,
  kLieDownBreak = 4,
  kMotivate = 5,
  kWalkRoundtrip = 6,
  kStartPomodoro = 7,
  kStopPomodoro = 8,
  kPomodoroForceBreak = 9,
  kPomodoroForceWork = 10,
  kSnoozeRest = 11,
  kToggleAutoRoundtrip = 12,
  kToggleRest = 13,
  kToggleChatter = 14,
  kToggleLock = 15,
  kSetScale = 16,
  kCloseBubble = 17,
  kQuit = 18,
};

struct CommandRequest {
  Command command = Command::kShow;
  int minutes = 0;      // kSnoozeRest
  double scale = 1.0;   // kSetScale
  int direction = 0;    // kWalkRoundtrip, 0 picks a random direction
};

enum class CommandStatus : std::uint8_t {
  kOk = 0,
  kNoOp = 1,
  kError = 2,
};

struct CommandResult {
  CommandStatus status = CommandStatus::kOk;
  std::string message{};

  [[nodiscard]] bool ok() const { return status == CommandStatus::kOk; }
};

template <typename TValue>
struct OpResult {
  bool ok = false;
  TValue value{};
  std::string error{};
};

constexpr std::array<double, 4> kScalePresets = {0.5, 0.75, 1.0, 1.25};

struct BubbleButton {
  std::string label{};
  CommandRequest request{};
};

struct BubbleContent {
  std::string title{};
  std::string message{};
  std::vector<BubbleButton> buttons{};
};

// Returns std::nullopt when the producer could not provide a line this time. Polled from
// Scheduler::RunUntil, so it must not throw: report failure through std::nullopt instead.
using DynamicTextSource = std::function<std::optional<std::string>()>;

enum class PointerButton : std::uint8_t {
  kLeft = 0,
  kRight = 1,
  kMiddle = 2,
};

enum class PointerOutcome : std::uint8_t {
  kNone = 0,
  kPressed = 1,
  kDragging = 2,
  kDragEnded = 3,
  kClick = 4,
  kLockedClick = 5,
  kContextMenu = 6,
};

const char* pose_label(PoseState pose);
const char* pomodoro_mode_label(PomodoroMode mode);
const char* command_label(Command command);

}  // namespace pawpal::core

#include "pawpal/core/drag_controller.hpp"

#include <string>

#include "pawpal/core/window_placement.hpp"

namespace pawpal::core {

DragController::DragController(ActivityFlags& flags,
                               PetWindow& window,
                               const ScreenGeometryProvider& screens,
                               BubblePositioner& bubble,
                               SettingsStore& settings,
                               EventLog& log,
                               DragConfig config)
    : flags_(flags), window_(window), screens_(screens), bubble_(bubble), settings_(settings), log_(log), config_(config) {}

PointerOutcome DragController::Press(PointerButton button, const Point& global, std::int64_t now_ms) {
  if (button == PointerButton::kRight) {
    return PointerOutcome::kContextMenu;
  }
  if (button != PointerButton::kLeft) {
    return PointerOutcome::kNone;
  }

  pressed_ = true;
  moved_ = false;
  press_ms_ = now_ms;
  press_global_ = global;
  if (flags_.locked) {
    // Still a click candidate, but the window stays put.
    flags_.dragging = false;
    return PointerOutcome::kPressed;
  }

  flags_.dragging = true;
  drag_offset_ = global - window_.position();
  return PointerOutcome::kPressed;
}

PointerOutcome DragController::Move(const Point& global) {
  if (!flags_.dragging) {
    return PointerOutcome::kNone;
  }
  if (manhattan_length(global - press_global_) > config_.threshold_px) {
    moved_ = true;
  }
  // No clamping while the pointer holds the window; Release() puts it back on screen.
  window_.Move(global - drag_offset_);
  bubble_.FollowTrackedWindow();
  return PointerOutcome::kDragging;
}

PointerOutcome DragController::Release(PointerButton button, const Point& global, std::int64_t now_ms) {
  if (button != PointerButton::kLeft || !pressed_) {
    return PointerOutcome::kNone;
  }
  pressed_ = false;
  const bool quick = (now_ms - press_ms_) < config_.click_max_ms;

  if (flags_.dragging) {
    (void)Move(global);
    finish_drag();
    if (!moved_ && quick) {
      return PointerOutcome::kClick;
    }
    return PointerOutcome::kDragEnded;
  }

  if (flags_.locked && quick) {
    return PointerOutcome::kLockedClick;
  }
  return PointerOutcome::kNone;
}

void DragController::finish_drag() {
  flags_.dragging = false;
  const Size size = window_.size();
  const Rect available = available_rect_for(window_, screens_);
  const Point clamped = clamp_into(window_.position(), size, available);
  const Point snapped = snap_to_edges(clamped, size, available, config_.snap_margin_px);
  if (snapped != window_.position()) {
    window_.Move(snapped);
  }
  bubble_.FollowTrackedWindow();

  settings_.SetInt(settings_keys::kPosX, snapped.x);
  settings_.SetInt(settings_keys::kPosY, snapped.y);
  log_.Push("drag", "released at " + std::to_string(snapped.x) + "," + std::to_string(snapped.y));
}

}  // namespace pawpal::core

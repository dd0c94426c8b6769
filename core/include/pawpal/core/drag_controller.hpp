#pragma once

#include <cstdint>

#include "pawpal/core/bubble_positioner.hpp"
#include "pawpal/core/config.hpp"
#include "pawpal/core/entities.hpp"
#include "pawpal/core/event_log.hpp"
#include "pawpal/core/services.hpp"
#include "pawpal/core/settings.hpp"

namespace pawpal::core {

// Tells clicks, drags and clicks on a locked pet apart and moves the window while a
// drag is in progress. Writes ActivityFlags::dragging.
class DragController {
 public:
  DragController(ActivityFlags& flags,
                 PetWindow& window,
                 const ScreenGeometryProvider& screens,
                 BubblePositioner& bubble,
                 SettingsStore& settings,
                 EventLog& log,
                 DragConfig config = {});

  PointerOutcome Press(PointerButton button, const Point& global, std::int64_t now_ms);
  PointerOutcome Move(const Point& global);
  PointerOutcome Release(PointerButton button, const Point& global, std::int64_t now_ms);

  [[nodiscard]] bool dragging() const { return flags_.dragging; }
  [[nodiscard]] bool moved() const { return moved_; }
  [[nodiscard]] const Point& press_point() const { return press_global_; }
  [[nodiscard]] const DragConfig& config() const { return config_; }

 private:
  void finish_drag();

  ActivityFlags& flags_;
  PetWindow& window_;
  const ScreenGeometryProvider& screens_;
  BubblePositioner& bubble_;
  SettingsStore& settings_;
  EventLog& log_;
  DragConfig config_{};

  bool pressed_ = false;
  bool moved_ = false;
  Point press_global_{};
  Point drag_offset_{};
  std::int64_t press_ms_ = 0;
};

}  // namespace pawpal::core

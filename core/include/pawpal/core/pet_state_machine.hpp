#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "pawpal/core/bubble_positioner.hpp"
#include "pawpal/core/config.hpp"
#include "pawpal/core/entities.hpp"
#include "pawpal/core/event_log.hpp"
#include "pawpal/core/services.hpp"
#include "pawpal/core/walk_controller.hpp"

namespace pawpal::core {

class PetStateMachine {
 public:
  PetStateMachine(PetModel& model,
                  PetWindow& window,
                  const ScreenGeometryProvider& screens,
                  WalkController& walker,
                  BubblePositioner& bubble,
                  EventLog& log,
                  AnimationConfig config = {});

  // Every pose must load; a missing asset fails the whole call.
  OpResult<bool> LoadAnimations(AnimationLoader& loader, const AssetPaths& paths);

  // Returns false and changes nothing when the pose has no animation.
  bool SetState(PoseState target, bool announce = false, const std::string& title = {}, const std::string& text = {});

  // Clamps to the configured range, resizes the window and keeps it on screen.
  double ApplyScale(double scale);

  [[nodiscard]] PoseState pose() const { return model_.pose; }
  [[nodiscard]] bool has_animation(PoseState pose) const;
  [[nodiscard]] const AnimationSurface* animation_for(PoseState pose) const;
  [[nodiscard]] const AnimationSurface* active_animation() const { return active_; }
  [[nodiscard]] const std::optional<Size>& uniform_base_size() const { return uniform_base_size_; }
  [[nodiscard]] const std::optional<Size>& rendered_size() const { return rendered_size_; }
  [[nodiscard]] std::size_t transition_count() const { return transition_count_; }

 private:
  void rescale();

  PetModel& model_;
  PetWindow& window_;
  const ScreenGeometryProvider& screens_;
  WalkController& walker_;
  BubblePositioner& bubble_;
  EventLog& log_;
  AnimationConfig config_{};

  std::array<std::unique_ptr<AnimationSurface>, kPoseCount> animations_{};
  AnimationSurface* active_ = nullptr;
  std::optional<Size> uniform_base_size_{};
  std::optional<Size> rendered_size_{};
  std::size_t transition_count_ = 0;
};

}  // namespace pawpal::core

#include "pawpal/core/pet_state_machine.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "pawpal/core/window_placement.hpp"

namespace pawpal::core {

namespace {

std::size_t pose_index(PoseState pose) {
  return static_cast<std::size_t>(pose);
}

}  // namespace

PetStateMachine::PetStateMachine(PetModel& model,
                                 PetWindow& window,
                                 const ScreenGeometryProvider& screens,
                                 WalkController& walker,
                                 BubblePositioner& bubble,
                                 EventLog& log,
                                 AnimationConfig config)
    : model_(model), window_(window), screens_(screens), walker_(walker), bubble_(bubble), log_(log), config_(config) {}

OpResult<bool> PetStateMachine::LoadAnimations(AnimationLoader& loader, const AssetPaths& paths) {
  OpResult<bool> result;
  std::array<std::unique_ptr<AnimationSurface>, kPoseCount> loaded{};
  for (PoseState pose : kAllPoses) {
    const std::string& path = paths.for_pose(pose);
    auto surface = loader.Load(path);
    if (!surface.ok || surface.value == nullptr) {
      result.error = std::string("missing asset for '") + pose_label(pose) + "': " + path;
      if (!surface.error.empty()) {
        result.error += " (" + surface.error + ")";
      }
      log_.Push("error", result.error);
      return result;
    }
    surface.value->SetPlaybackSpeedPercent(is_walking(pose) ? config_.walk_speed_percent : config_.idle_speed_percent);
    loaded[pose_index(pose)] = std::move(surface.value);
  }

  // One base size for every pose so a pose switch never resizes the window.
  Size base{};
  for (const auto& surface : loaded) {
    const Size frame = surface->current_frame_size();
    base.width = std::max(base.width, frame.width);
    base.height = std::max(base.height, frame.height);
  }
  animations_ = std::move(loaded);
  active_ = nullptr;
  rendered_size_.reset();
  if (base.empty()) {
    uniform_base_size_.reset();
  } else {
    uniform_base_size_ = base;
  }

  result.ok = true;
  result.value = true;
  return result;
}

bool PetStateMachine::has_animation(PoseState pose) const {
  const std::size_t index = pose_index(pose);
  return index < animations_.size() && animations_[index] != nullptr;
}

const AnimationSurface* PetStateMachine::animation_for(PoseState pose) const {
  return has_animation(pose) ? animations_[pose_index(pose)].get() : nullptr;
}

bool PetStateMachine::SetState(PoseState target, bool announce, const std::string& title, const std::string& text) {
  if (!has_animation(target)) {
    return false;
  }

  for (auto& surface : animations_) {
    if (surface != nullptr) {
      surface->Stop();
    }
  }

  const PoseState previous = model_.pose;
  model_.pose = target;
  active_ = animations_[pose_index(target)].get();
  active_->Start();
  ++transition_count_;

  if (is_walking(target)) {
    walker_.Start(target == PoseState::kWalkingLeft ? -1 : +1);
  } else {
    // A roundtrip cannot outlive the walking pose.
    model_.roundtrip = RoundtripWalk{};
    walker_.Stop();
  }

  rescale();

  if (previous != target) {
    log_.Push("pose", std::string(pose_label(previous)) + " -> " + pose_label(target));
  }
  if (announce && (!title.empty() || !text.empty())) {
    bubble_.Announce(title.empty() ? "Hey" : title, text, 2400);
  }
  return true;
}

double PetStateMachine::ApplyScale(double scale) {
  if (!std::isfinite(scale)) {
    log_.Push("error", "ignored non-finite scale");
    return model_.scale;
  }
  model_.scale = std::clamp(scale, config_.min_scale, config_.max_scale);
  rescale();
  return model_.scale;
}

void PetStateMachine::rescale() {
  if (!uniform_base_size_.has_value()) {
    return;
  }
  model_.scale = std::clamp(model_.scale, config_.min_scale, config_.max_scale);
  const Size target{static_cast<int>(uniform_base_size_->width * model_.scale),
                    static_cast<int>(uniform_base_size_->height * model_.scale)};
  if (window_.size() != target) {
    window_.Resize(target);
  }
  // Rescaling decoded frames is expensive; only push real changes.
  if (!rendered_size_.has_value() || *rendered_size_ != target) {
    for (auto& surface : animations_) {
      if (surface != nullptr) {
        surface->SetRenderedSize(target);
      }
    }
    rendered_size_ = target;
  }
  (void)EnsureOnScreen(window_, screens_);
  bubble_.FollowTrackedWindow();
}

}  // namespace pawpal::core

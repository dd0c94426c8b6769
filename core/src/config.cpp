#include "pawpal/core/config.hpp"

#include <algorithm>
#include <string>

#include "pawpal/core/settings.hpp"

namespace pawpal::core {

namespace {

constexpr const char* kAssetSit = "dog_sit_tr.gif";
constexpr const char* kAssetLieDown = "dog_laydown_tr.gif";
constexpr const char* kAssetWalkLeft = "dog_walkingleft_tr.gif";
constexpr const char* kAssetWalkRight = "dog_walkingright_tr.gif";
constexpr const char* kAssetTray = "tray.png";

std::string join_path(const std::string& base, const std::string& leaf) {
  if (base.empty()) {
    return leaf;
  }
  const char last = base.back();
  if (last == '/' || last == '\\') {
    return base + leaf;
  }
  return base + "/" + leaf;
}

}  // namespace

PetConfig LoadPetConfig(const SettingsStore& settings) {
  PetConfig config{};

  WalkConfig& walk = config.walk;
  walk.speed_px_per_sec = std::max(1.0, settings.GetDouble("tuning.walk_speed_px_per_sec", walk.speed_px_per_sec));
  walk.tick_ms = std::clamp(settings.GetInt("tuning.walk_tick_ms", walk.tick_ms), 10, 1000);
  walk.bob_px = std::clamp(settings.GetInt("tuning.walk_bob_px", walk.bob_px), 0, 32);
  walk.bob_period_ms = std::max(0, settings.GetInt("tuning.walk_bob_period_ms", walk.bob_period_ms));

  AnimationConfig& animation = config.animation;
  animation.idle_speed_percent =
      std::clamp(settings.GetInt("tuning.idle_speed_percent", animation.idle_speed_percent), 1, 1000);
  animation.walk_speed_percent =
      std::clamp(settings.GetInt("tuning.walk_speed_percent", animation.walk_speed_percent), 1, 1000);

  BehaviorConfig& behavior = config.behavior;
  behavior.rest_pose_ms = std::max(0, settings.GetInt("tuning.rest_pose_ms", behavior.rest_pose_ms));
  behavior.chatter_min_ms = std::max(1000, settings.GetInt("tuning.chatter_min_ms", behavior.chatter_min_ms));
  behavior.chatter_max_ms =
      std::max(behavior.chatter_min_ms, settings.GetInt("tuning.chatter_max_ms", behavior.chatter_max_ms));
  behavior.chatter_probability =
      std::clamp(settings.GetDouble("tuning.chatter_probability", behavior.chatter_probability), 0.0, 1.0);
  const int auto_minutes = settings.GetInt("tuning.auto_roundtrip_minutes", 30);
  behavior.auto_roundtrip_ms = static_cast<std::int64_t>(std::max(1, auto_minutes)) * 60 * 1000;

  PomodoroConfig& pomodoro = config.pomodoro;
  pomodoro.work_seconds = std::max(1, settings.GetInt("tuning.pomodoro_work_seconds", pomodoro.work_seconds));
  pomodoro.break_seconds = std::max(1, settings.GetInt("tuning.pomodoro_break_seconds", pomodoro.break_seconds));

  const int anchor = settings.GetInt("tuning.bubble_anchor_mode", static_cast<int>(config.bubble.anchor_mode));
  config.bubble.anchor_mode = anchor == static_cast<int>(AnchorMode::kCenter) ? AnchorMode::kCenter : AnchorMode::kHead;
  return config;
}

const std::string& AssetPaths::for_pose(PoseState pose) const {
  switch (pose) {
  case PoseState::kSitting:
    return sit;
  case PoseState::kLyingDown:
    return lie_down;
  case PoseState::kWalkingLeft:
    return walk_left;
  case PoseState::kWalkingRight:
  default:
    return walk_right;
  }
}

AssetPaths ResolveAssetPaths(const std::string& base_dir) {
  const std::string assets = join_path(base_dir, "assets");
  AssetPaths paths{};
  paths.sit = join_path(assets, kAssetSit);
  paths.lie_down = join_path(assets, kAssetLieDown);
  paths.walk_left = join_path(assets, kAssetWalkLeft);
  paths.walk_right = join_path(assets, kAssetWalkRight);
  paths.tray_icon = join_path(assets, kAssetTray);
  return paths;
}

}  // namespace pawpal::core

#pragma once

#include <cstdint>
#include <string>

#include "pawpal/core/entities.hpp"
#include "pawpal/core/types.hpp"

namespace pawpal::core {

class SettingsStore;

struct WalkConfig {
  double speed_px_per_sec = 90.0;
  int tick_ms = 55;
  int bob_px = 2;
  int bob_period_ms = 420;
};

struct AnimationConfig {
  int idle_speed_percent = 20;
  int walk_speed_percent = 115;
  double min_scale = 0.3;
  double max_scale = 2.0;
  double wheel_step = 1.1;
};

struct BubbleConfig {
  int min_width = 160;
  int max_width = 360;
  int gap_y = 18;
  int pad_x = 12;
  int pad_y = 10;
  int tail_width = 16;
  int tail_height = 10;
  int spacing = 4;
  int button_row_margin = 6;
  int min_refresh_ms = 250;
  int default_duration_ms = 3200;
  AnchorMode anchor_mode = AnchorMode::kHead;
};

struct DragConfig {
  int threshold_px = 6;
  int snap_margin_px = 18;
  int click_max_ms = 350;
};

struct BehaviorConfig {
  int rest_pose_ms = 15'000;
  int chatter_min_ms = 45'000;
  int chatter_max_ms = 140'000;
  double chatter_probability = 0.6;
  std::int64_t auto_roundtrip_ms = 30LL * 60 * 1000;
  int snooze_minutes = 10;
};

struct PomodoroConfig {
  int work_seconds = 25 * 60;
  int break_seconds = 5 * 60;
};

struct StartupConfig {
  Point default_position{80, 80};
  int ensure_on_screen_delay_ms = 180;
  int hello_delay_ms = 650;
};

struct PetConfig {
  WalkConfig walk{};
  AnimationConfig animation{};
  BubbleConfig bubble{};
  DragConfig drag{};
  BehaviorConfig behavior{};
  PomodoroConfig pomodoro{};
  StartupConfig startup{};
};

// Compiled defaults overridden by optional "tuning.*" keys of the settings store.
PetConfig LoadPetConfig(const SettingsStore& settings);

struct AssetPaths {
  std::string sit{};
  std::string lie_down{};
  std::string walk_left{};
  std::string walk_right{};
  std::string tray_icon{};

  [[nodiscard]] const std::string& for_pose(PoseState pose) const;
};

// Joins the fixed asset file names onto base_dir/assets.
AssetPaths ResolveAssetPaths(const std::string& base_dir);

}  // namespace pawpal::core

#include <cmath>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pawpal/core/bubble_positioner.hpp"
#include "pawpal/core/config.hpp"
#include "pawpal/core/event_log.hpp"
#include "pawpal/core/pet_core.hpp"
#include "pawpal/core/pomodoro_timer.hpp"
#include "pawpal/core/scheduler.hpp"
#include "pawpal/core/services.hpp"
#include "pawpal/core/settings.hpp"
#include "pawpal/core/window_placement.hpp"

namespace {

using pawpal::core::AnimationLoader;
using pawpal::core::AnimationSurface;
using pawpal::core::AssetPaths;
using pawpal::core::BubbleContent;
using pawpal::core::BubblePositioner;
using pawpal::core::Command;
using pawpal::core::CommandRequest;
using pawpal::core::CommandStatus;
using pawpal::core::EventLog;
using pawpal::core::IniSettingsStore;
using pawpal::core::kInvalidTimerId;
using pawpal::core::OpResult;
using pawpal::core::PetConfig;
using pawpal::core::PetCore;
using pawpal::core::PetWindow;
using pawpal::core::Point;
using pawpal::core::PointerButton;
using pawpal::core::PointerOutcome;
using pawpal::core::PomodoroMode;
using pawpal::core::PoseState;
using pawpal::core::RandomSource;
using pawpal::core::Rect;
using pawpal::core::Scheduler;
using pawpal::core::ScreenGeometryProvider;
using pawpal::core::SettingsStore;
using pawpal::core::Size;
using pawpal::core::TextMeasurer;
using pawpal::core::TextRole;
using pawpal::core::TimerId;

namespace keys = pawpal::core::settings_keys;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

// Primary 1920x1080 with a 1280x1024 monitor to its right.
class FakeScreens final : public ScreenGeometryProvider {
 public:
  std::vector<Rect> screens{{0, 0, 1920, 1080}, {1920, 0, 1280, 1024}};

  Rect AvailableRectAt(const Point& point) const override {
    for (const Rect& screen : screens) {
      if (screen.contains(point)) {
        return screen;
      }
    }
    return screens.front();
  }
};

class FakeWindow final : public PetWindow {
 public:
  Point position() const override { return position_; }
  Size size() const override { return size_; }
  bool visible() const override { return visible_; }
  void Move(const Point& top_left) override {
    position_ = top_left;
    ++move_count;
  }
  void Resize(const Size& size) override { size_ = size; }
  void SetVisible(bool visible) override { visible_ = visible; }

  int move_count = 0;

 private:
  Point position_{};
  Size size_{120, 100};
  bool visible_ = true;
};

class FakeAnimationSurface final : public AnimationSurface {
 public:
  explicit FakeAnimationSurface(Size frame) : frame_(frame) {}

  void Start() override { playing_ = true; }
  void Stop() override { playing_ = false; }
  bool playing() const override { return playing_; }
  Size current_frame_size() const override { return frame_; }
  void SetPlaybackSpeedPercent(int percent) override { speed_percent = percent; }
  void SetRenderedSize(const Size& size) override {
    rendered = size;
    ++rendered_updates;
  }

  int speed_percent = 100;
  Size rendered{};
  int rendered_updates = 0;

 private:
  Size frame_{};
  bool playing_ = false;
};

class FakeAnimationLoader final : public AnimationLoader {
 public:
  std::map<std::string, Size> files{};
  std::map<std::string, FakeAnimationSurface*> loaded{};

  OpResult<std::unique_ptr<AnimationSurface>> Load(const std::string& path) override {
    OpResult<std::unique_ptr<AnimationSurface>> result;
    auto it = files.find(path);
    if (it == files.end()) {
      result.error = "no such file";
      return result;
    }
    auto surface = std::make_unique<FakeAnimationSurface>(it->second);
    loaded[path] = surface.get();
    result.ok = true;
    result.value = std::move(surface);
    return result;
  }
};

// 7 px per character, 16 px per wrapped line.
class FakeTextMeasurer final : public TextMeasurer {
 public:
  Size MeasureText(std::string_view text, TextRole, int wrap_width) const override {
    if (text.empty()) {
      return {};
    }
    const int natural = static_cast<int>(text.size()) * 7;
    if (wrap_width <= 0 || natural <= wrap_width) {
      return {natural, 16};
    }
    const int lines = (natural + wrap_width - 1) / wrap_width;
    return {wrap_width, lines * 16};
  }

  Size MeasureButtonRow(const std::vector<std::string>& labels) const override {
    int width = 0;
    for (const std::string& label : labels) {
      width += static_cast<int>(label.size()) * 7 + 16;
    }
    if (!labels.empty()) {
      width += static_cast<int>(labels.size() - 1) * 6;
    }
    return {width, 24};
  }
};

class MemorySettingsStore final : public SettingsStore {
 public:
  MemorySettingsStore() = default;
  explicit MemorySettingsStore(std::map<std::string, std::string, std::less<>> values) : values_(std::move(values)) {}

  std::optional<std::string> Find(std::string_view key) const override {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void Set(std::string_view key, std::string value) override { values_[std::string(key)] = std::move(value); }

  OpResult<bool> Flush() override {
    OpResult<bool> result;
    ++flush_count;
    if (fail_flush) {
      result.error = "disk full";
      return result;
    }
    result.ok = true;
    result.value = true;
    return result;
  }

  int flush_count = 0;
  bool fail_flush = false;

 private:
  std::map<std::string, std::string, std::less<>> values_{};
};

// Returns queued values first, then the fallbacks.
class ScriptedRandom final : public RandomSource {
 public:
  std::deque<double> units{};
  std::deque<int> ints{};
  double fallback_unit = 0.99;

  double NextUnit() override {
    if (units.empty()) {
      return fallback_unit;
    }
    const double value = units.front();
    units.pop_front();
    return value;
  }

  int NextInt(int lo, int hi) override {
    if (ints.empty()) {
      return lo;
    }
    const int value = ints.front();
    ints.pop_front();
    return value < lo ? lo : (value > hi ? hi : value);
  }
};

using SettingsMap = std::map<std::string, std::string, std::less<>>;

// Every background behavior off so a test only sees what it triggers.
SettingsMap quiet_settings() {
  return {
      {std::string(keys::kChatterEnabled), "false"},
      {std::string(keys::kRestEnabled), "false"},
      {std::string(keys::kAutoRoundtripEnabled), "false"},
  };
}

SettingsMap with(SettingsMap base, const std::string& key, const std::string& value) {
  base[key] = value;
  return base;
}

struct PetFixture {
  explicit PetFixture(SettingsMap seed = quiet_settings(), const PetConfig& config = {})
      : settings(std::move(seed)), core(screens, window, measurer, settings, random, config) {
    paths = pawpal::core::ResolveAssetPaths("/pets");
    loader.files[paths.sit] = {120, 100};
    loader.files[paths.lie_down] = {110, 90};
    loader.files[paths.walk_left] = {100, 100};
    loader.files[paths.walk_right] = {100, 100};
  }

  bool start() { return core.Initialize(loader, paths).ok; }

  FakeAnimationSurface* surface(const std::string& path) {
    auto it = loader.loaded.find(path);
    return it == loader.loaded.end() ? nullptr : it->second;
  }

  FakeScreens screens;
  FakeWindow window;
  FakeTextMeasurer measurer;
  MemorySettingsStore settings;
  ScriptedRandom random;
  FakeAnimationLoader loader;
  AssetPaths paths{};
  PetCore core;
};

CommandRequest walk_request(int direction) {
  CommandRequest request{};
  request.command = Command::kWalkRoundtrip;
  request.direction = direction;
  return request;
}

bool frame_on_screen(const PetFixture& fx) {
  const Rect frame = fx.window.frame();
  for (const Rect& screen : fx.screens.screens) {
    if (screen.contains(frame)) {
      return true;
    }
  }
  return false;
}

bool bubble_titled(const PetCore& core, const std::string& title) {
  return core.bubble().visible() && core.bubble().content().title == title;
}

// Intent: due entries fire by time, ties in arming order.
bool test_scheduler_orders_by_time_then_arming() {
  Scheduler scheduler;
  std::string order;
  (void)scheduler.ScheduleOnce(100, [&]() { order += "A"; });
  (void)scheduler.ScheduleOnce(50, [&]() { order += "B"; });
  (void)scheduler.ScheduleOnce(100, [&]() { order += "C"; });
  const std::size_t fired = scheduler.RunUntil(99);
  if (fired != 1 || order != "B") {
    return false;
  }
  return scheduler.RunUntil(100) == 2 && order == "BAC" && scheduler.active_count() == 0;
}

// Intent: a recurring callback may cancel its own timer; cancelled entries never fire.
bool test_scheduler_cancel_and_self_cancel() {
  Scheduler scheduler;
  int ticks = 0;
  TimerId every = kInvalidTimerId;
  every = scheduler.ScheduleEvery(10, [&]() {
    if (++ticks == 3) {
      scheduler.CancelAndReset(every);
    }
  });
  bool cancelled_fired = false;
  const TimerId once = scheduler.ScheduleOnce(20, [&]() { cancelled_fired = true; });
  const bool armed = scheduler.is_active(once) && scheduler.fire_time(once) == 20 && scheduler.next_due_ms() == 10;
  const bool cancelled = scheduler.Cancel(once);
  const bool forgotten = !scheduler.is_active(once) && !scheduler.fire_time(once).has_value();
  (void)scheduler.RunUntil(1000);
  return armed && cancelled && forgotten && !cancelled_fired && ticks == 3 && every == kInvalidTimerId &&
         !scheduler.Cancel(once) && !scheduler.next_due_ms().has_value();
}

// Intent: virtual time steps to each fire time, so timers armed inside callbacks land correctly.
bool test_scheduler_virtual_time_steps() {
  Scheduler scheduler(1000);
  std::vector<std::int64_t> seen;
  (void)scheduler.ScheduleOnce(20, [&]() {
    seen.push_back(scheduler.now_ms());
    (void)scheduler.ScheduleOnce(30, [&]() { seen.push_back(scheduler.now_ms()); });
  });
  (void)scheduler.Advance(100);
  return seen.size() == 2 && seen[0] == 1020 && seen[1] == 1050 && scheduler.now_ms() == 1100;
}

// Intent: typed getters coerce malformed values to the caller's default.
bool test_settings_coercion_falls_back() {
  MemorySettingsStore store(SettingsMap{
      {"locked", "maybe"},
      {"chatter_enabled", " OFF "},
      {"rest_interval_minutes", "12x"},
      {"pos_x", " 7 "},
      {"scale", "abc"},
  });
  return store.GetBool("locked", true) &&
         !store.GetBool("chatter_enabled", true) &&
         store.GetInt("rest_interval_minutes", 50) == 50 &&
         store.GetInt("pos_x", 0) == 7 &&
         store.GetDouble("scale", 1.0) == 1.0 &&
         pawpal::core::parse_double("nan", 1.0) == 1.0 &&
         pawpal::core::parse_double("-inf", 0.5) == 0.5 &&
         store.GetInt("missing", -4) == -4 &&
         pawpal::core::parse_int("99999999999", 3) == 3;
}

// Intent: the ini store skips comments and malformed lines and persists what was set.
bool test_ini_settings_load_and_flush() {
  const auto path = std::filesystem::temp_directory_path() / "pawpal_core_tests_settings.ini";
  {
    std::ofstream ofs(path, std::ios::trunc);
    ofs << "# pawpal\n"
        << "; comment\n"
        << "locked = yes\n"
        << "no separator here\n"
        << "=orphan\n"
        << "scale=1.25\n";
  }

  IniSettingsStore store(path.string());
  const auto loaded = store.Load();
  if (!loaded.ok || !loaded.value || !store.GetBool("locked", false) || store.GetDouble("scale", 1.0) != 1.25) {
    return false;
  }
  if (store.Find("no separator here").has_value()) {
    return false;
  }
  store.SetInt(keys::kPosX, 321);
  const bool was_dirty = store.dirty();
  const auto flushed = store.Flush();

  IniSettingsStore reread(path.string());
  const bool reloaded = reread.Load().ok;
  const bool round = reread.GetInt(keys::kPosX, 0) == 321 && reread.GetBool("locked", false);
  std::filesystem::remove(path);

  IniSettingsStore missing((std::filesystem::temp_directory_path() / "pawpal_core_tests_absent.ini").string());
  const auto absent = missing.Load();
  return was_dirty && flushed.ok && !store.dirty() && reloaded && round && absent.ok && !absent.value;
}

// Intent: tuning keys override compiled defaults and are clamped to sane ranges.
bool test_config_tuning_keys_clamped() {
  MemorySettingsStore store(SettingsMap{
      {"tuning.walk_tick_ms", "5"},
      {"tuning.chatter_probability", "2"},
      {"tuning.pomodoro_work_seconds", "60"},
      {"tuning.bubble_anchor_mode", "1"},
  });
  const PetConfig config = pawpal::core::LoadPetConfig(store);
  return config.walk.tick_ms == 10 &&
         config.behavior.chatter_probability == 1.0 &&
         config.pomodoro.work_seconds == 60 &&
         config.pomodoro.break_seconds == 300 &&
         config.walk.speed_px_per_sec == 90.0 &&
         config.bubble.anchor_mode == pawpal::core::AnchorMode::kCenter;
}

// Intent: the log keeps only the newest lines.
bool test_event_log_is_bounded() {
  EventLog log(3);
  for (int i = 0; i < 5; ++i) {
    log.Push("t", std::to_string(i));
  }
  return log.lines().size() == 3 && log.lines().front() == "[t] 2" && log.total_pushed() == 5 &&
         log.contains("[t] 4") && !log.contains("[t] 1");
}

// Intent: a missing animation asset fails startup and arms nothing.
bool test_missing_asset_is_fatal() {
  PetFixture fx;
  fx.loader.files.erase(fx.paths.walk_left);
  const auto result = fx.core.Initialize(fx.loader, fx.paths);
  return !result.ok &&
         result.error.find("missing asset") != std::string::npos &&
         result.error.find(fx.paths.walk_left) != std::string::npos &&
         !fx.core.initialized() &&
         fx.core.scheduler().active_count() == 0 &&
         fx.core.log().contains("[error]");
}

// Intent: startup loads every pose with uniform size, plays only the active one, then greets.
bool test_startup_loads_poses_and_greets() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  FakeAnimationSurface* sit = fx.surface(fx.paths.sit);
  FakeAnimationSurface* walk = fx.surface(fx.paths.walk_right);
  FakeAnimationSurface* lie = fx.surface(fx.paths.lie_down);
  if (sit == nullptr || walk == nullptr || lie == nullptr) {
    return false;
  }
  const bool playback = sit->playing() && !walk->playing() && !lie->playing() &&
                        sit->speed_percent == 20 && walk->speed_percent == 115;
  const bool uniform = lie->rendered == Size{120, 100} && fx.window.size() == Size{120, 100};
  const bool positioned = fx.window.position() == Point{80, 80};
  const bool quiet_before = !fx.core.bubble().visible();
  (void)fx.core.Advance(650);
  return playback && uniform && positioned && quiet_before && bubble_titled(fx.core, "Hello");
}

// Intent: a persisted off-screen position is clamped back onto the primary monitor.
bool test_startup_clamps_persisted_position() {
  PetFixture fx(with(with(quiet_settings(), "pos_x", "5000"), "pos_y", "40"));
  if (!fx.start()) {
    return false;
  }
  return fx.window.position() == Point{1800, 40} && frame_on_screen(fx);
}

// Intent: the delayed startup check pulls a window back that moved off screen meanwhile.
bool test_startup_delayed_on_screen_check() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  fx.window.Move({-500, -500});
  (void)fx.core.Advance(179);
  const bool still_off = fx.window.position() == Point{-500, -500};
  (void)fx.core.Advance(1);
  return still_off && fx.window.position() == Point{0, 0};
}

// Intent: a roundtrip request starts walking in the requested direction with two edges to go.
bool test_roundtrip_starts_in_requested_direction() {
  PetFixture left;
  PetFixture right;
  if (!left.start() || !right.start()) {
    return false;
  }
  const auto left_result = left.core.Dispatch(walk_request(-1));
  const auto right_result = right.core.Dispatch(walk_request(+1));
  const auto& lm = left.core.model();
  const auto& rm = right.core.model();
  return left_result.ok() && right_result.ok() &&
         lm.pose == PoseState::kWalkingLeft && lm.roundtrip.active && lm.roundtrip.direction == -1 &&
         lm.roundtrip.edge_hits_remaining == 2 && left.core.walker().direction() == -1 &&
         rm.pose == PoseState::kWalkingRight && rm.roundtrip.active && rm.roundtrip.direction == +1 &&
         rm.roundtrip.edge_hits_remaining == 2 && right.core.walker().direction() == +1;
}

// Intent: direction 0 asks the random source for a side.
bool test_roundtrip_random_direction() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  fx.random.ints = {1};
  const auto result = fx.core.Dispatch(walk_request(0));
  return result.ok() && fx.core.model().pose == PoseState::kWalkingRight;
}

// Intent: 100 ticks at 90 px/s and 55 ms move 495 px give or take one.
bool test_walk_accumulator_sums_within_one_px() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  const int start_x = fx.window.position().x;
  if (!fx.core.Dispatch(walk_request(+1)).ok()) {
    return false;
  }
  (void)fx.core.Advance(100 * 55);
  const int travelled = fx.window.position().x - start_x;
  return std::abs(travelled - 495) <= 1 && fx.core.walker().accumulator() < 1.0;
}

// Intent: at the first edge the walk reverses and one edge remains.
bool test_walk_first_edge_reverses() {
  PetFixture fx(with(quiet_settings(), "pos_x", "1800"));
  if (!fx.start() || fx.window.position().x != 1800) {
    return false;
  }
  if (!fx.core.Dispatch(walk_request(+1)).ok()) {
    return false;
  }
  (void)fx.core.Advance(55);
  const auto& model = fx.core.model();
  return model.pose == PoseState::kWalkingLeft &&
         model.roundtrip.active &&
         model.roundtrip.direction == -1 &&
         model.roundtrip.edge_hits_remaining == 1 &&
         fx.window.position().x == 1800;
}

// Intent: a full roundtrip stays on screen and ends sitting at the far edge on its baseline.
bool test_walk_roundtrip_completes_on_screen() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  const int baseline = fx.window.position().y;
  if (!fx.core.Dispatch(walk_request(+1)).ok()) {
    return false;
  }
  bool reached_right = false;
  for (int step = 0; step < 1000 && fx.core.model().roundtrip.active; ++step) {
    (void)fx.core.Advance(55);
    if (!frame_on_screen(fx)) {
      return false;
    }
    if (std::abs(fx.window.position().y - baseline) > fx.core.walker().config().bob_px) {
      return false;
    }
    reached_right = reached_right || fx.window.position().x == 1800;
  }
  const auto& model = fx.core.model();
  return reached_right &&
         !model.roundtrip.active &&
         model.pose == PoseState::kSitting &&
         !fx.core.walker().walking() &&
         fx.core.walker().tick_timer() == kInvalidTimerId &&
         fx.window.position() == Point{0, baseline} &&
         bubble_titled(fx.core, "Walk finished");
}

// Intent: walk ticks leave the window alone while a drag holds it.
bool test_walk_pauses_while_dragging() {
  PetFixture fx;
  if (!fx.start() || !fx.core.Dispatch(walk_request(+1)).ok()) {
    return false;
  }
  (void)fx.core.Advance(55);
  const Point held = fx.window.position();
  const Point grip = held + Point{10, 10};
  if (fx.core.OnPointerPress(PointerButton::kLeft, grip, fx.core.scheduler().now_ms()) != PointerOutcome::kPressed) {
    return false;
  }
  (void)fx.core.Advance(550);
  const bool frozen = fx.window.position() == held && fx.core.model().flags.dragging;
  (void)fx.core.OnPointerRelease(PointerButton::kLeft, grip, fx.core.scheduler().now_ms());
  (void)fx.core.Advance(55);
  return frozen && fx.window.position().x > held.x;
}

// Intent: a rest reminder ends an active roundtrip and lies the pet down, then it gets up.
bool test_rest_preempts_roundtrip() {
  PetFixture fx;
  if (!fx.start() || !fx.core.Dispatch(walk_request(+1)).ok()) {
    return false;
  }
  (void)fx.core.Advance(550);
  fx.core.behavior().FireRestReminder();
  const auto& model = fx.core.model();
  const auto& buttons = fx.core.bubble().content().buttons;
  const bool preempted = !model.roundtrip.active && model.pose == PoseState::kLyingDown &&
                         !fx.core.walker().walking() && bubble_titled(fx.core, "Rest time") &&
                         buttons.size() == 1 && buttons[0].request.command == Command::kSnoozeRest &&
                         buttons[0].request.minutes == 10;
  (void)fx.core.Advance(15000);
  return preempted && model.pose == PoseState::kSitting;
}

// Intent: with rest enabled the reminder fires once per interval.
bool test_rest_reminder_fires_on_interval() {
  PetFixture fx(with(with(quiet_settings(), std::string(keys::kRestEnabled), "true"),
                     std::string(keys::kRestIntervalMinutes), "1"));
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.Advance(59'999);
  const bool early = fx.core.model().pose == PoseState::kSitting;
  (void)fx.core.Advance(1);
  return early && fx.core.model().pose == PoseState::kLyingDown && bubble_titled(fx.core, "Rest time");
}

// Intent: snooze replaces the reminder for a while and resumes it afterwards.
bool test_rest_snooze_and_resume() {
  PetFixture fx(with(quiet_settings(), std::string(keys::kRestEnabled), "true"));
  if (!fx.start() || fx.core.behavior().rest_timer() == kInvalidTimerId) {
    return false;
  }
  CommandRequest zero{};
  zero.command = Command::kSnoozeRest;
  zero.minutes = 0;
  const bool zero_ignored = fx.core.Dispatch(zero).status == CommandStatus::kNoOp &&
                            fx.core.behavior().rest_timer() != kInvalidTimerId &&
                            bubble_titled(fx.core, "Snooze");

  CommandRequest snooze = zero;
  snooze.minutes = 2;
  const bool snoozed = fx.core.Dispatch(snooze).ok() &&
                       fx.core.behavior().rest_timer() == kInvalidTimerId &&
                       fx.core.behavior().snooze_timer() != kInvalidTimerId;
  (void)fx.core.Advance(2 * 60 * 1000);
  return zero_ignored && snoozed &&
         fx.core.behavior().snooze_timer() == kInvalidTimerId &&
         fx.core.behavior().rest_timer() != kInvalidTimerId &&
         fx.core.log().contains("resumed after snooze");
}

// Intent: a short still press is a click; a press that travels is a drag and is persisted.
bool test_drag_click_versus_drag() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  const Point origin = fx.window.position();
  (void)fx.core.OnPointerPress(PointerButton::kLeft, {100, 100}, 1000);
  const auto click = fx.core.OnPointerRelease(PointerButton::kLeft, {100, 100}, 1100);
  const bool clicked = click == PointerOutcome::kClick && fx.window.position() == origin &&
                       bubble_titled(fx.core, "Focus");

  (void)fx.core.OnPointerPress(PointerButton::kLeft, {100, 100}, 2000);
  const auto moving = fx.core.OnPointerMove({150, 130});
  const auto ended = fx.core.OnPointerRelease(PointerButton::kLeft, {150, 130}, 2200);
  return clicked && moving == PointerOutcome::kDragging && ended == PointerOutcome::kDragEnded &&
         fx.window.position() == Point{130, 110} &&
         fx.settings.GetInt(keys::kPosX, 0) == 130 && fx.settings.GetInt(keys::kPosY, 0) == 110 &&
         !fx.core.model().flags.dragging;
}

// Intent: a slow press without movement is neither a click nor a drag.
bool test_drag_slow_press_is_not_click() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.OnPointerPress(PointerButton::kLeft, {100, 100}, 1000);
  return fx.core.OnPointerRelease(PointerButton::kLeft, {100, 100}, 1400) == PointerOutcome::kDragEnded;
}

// Intent: a drop near a monitor edge snaps to it.
bool test_drag_snaps_to_nearby_edge() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.OnPointerPress(PointerButton::kLeft, {100, 100}, 0);
  (void)fx.core.OnPointerMove({35, 100});
  (void)fx.core.OnPointerRelease(PointerButton::kLeft, {35, 100}, 800);
  return fx.window.position() == Point{0, 80};
}

// Intent: a locked pet ignores drags and answers a click with a hint.
bool test_drag_locked_click() {
  PetFixture fx;
  if (!fx.start() || !fx.core.Dispatch(Command::kToggleLock).ok()) {
    return false;
  }
  const Point origin = fx.window.position();
  (void)fx.core.OnPointerPress(PointerButton::kLeft, {100, 100}, 5000);
  const auto moved = fx.core.OnPointerMove({300, 300});
  const auto released = fx.core.OnPointerRelease(PointerButton::kLeft, {300, 300}, 5100);
  return moved == PointerOutcome::kNone && released == PointerOutcome::kLockedClick &&
         fx.window.position() == origin && bubble_titled(fx.core, "Locked") &&
         fx.settings.GetBool(keys::kLocked, false);
}

// Intent: the right button asks for the context menu and never starts a drag.
bool test_right_press_opens_menu() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  return fx.core.OnPointerPress(PointerButton::kRight, {100, 100}, 0) == PointerOutcome::kContextMenu &&
         !fx.core.model().flags.dragging;
}

// Intent: double click toggles between sitting and lying down.
bool test_double_click_toggles_pose() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  fx.core.OnDoubleClick();
  const bool lying = fx.core.model().pose == PoseState::kLyingDown && bubble_titled(fx.core, "Break");
  fx.core.OnDoubleClick();
  return lying && fx.core.model().pose == PoseState::kSitting && bubble_titled(fx.core, "Focus");
}

// Intent: 1500 one-second ticks end the work phase in a 300 s break, and the break ends in work.
bool test_pomodoro_work_then_break() {
  PetFixture fx;
  if (!fx.start() || !fx.core.Dispatch(Command::kStartPomodoro).ok()) {
    return false;
  }
  const auto& state = fx.core.pomodoro().state();
  const bool started = state.running && state.mode == PomodoroMode::kWork && state.seconds_remaining == 1500 &&
                       fx.core.bubble().dynamic_text() == "Focus: 25:00 remaining" &&
                       fx.core.bubble().hide_timer() == kInvalidTimerId;
  (void)fx.core.Advance(1499 * 1000);
  const bool last_second = state.mode == PomodoroMode::kWork && state.seconds_remaining == 1;
  (void)fx.core.Advance(1000);
  const bool on_break = state.running && state.mode == PomodoroMode::kBreak && state.seconds_remaining == 300 &&
                        fx.core.model().pose == PoseState::kLyingDown &&
                        fx.core.bubble().dynamic_text() == "Break: 05:00 remaining";
  (void)fx.core.Advance(300 * 1000);
  return started && last_second && on_break &&
         state.mode == PomodoroMode::kWork && state.seconds_remaining == 1500 &&
         fx.core.model().pose == PoseState::kSitting;
}

// Intent: forcing a phase needs a running pomodoro; starting twice is a no-op.
bool test_pomodoro_force_requires_running() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  const auto refused = fx.core.Dispatch(Command::kPomodoroForceBreak);
  const bool hint = fx.core.bubble().content().message == "Start it first.";
  const bool stays_sitting = fx.core.model().pose == PoseState::kSitting;
  (void)fx.core.Dispatch(Command::kStartPomodoro);
  const auto again = fx.core.Dispatch(Command::kStartPomodoro);
  const auto forced = fx.core.Dispatch(Command::kPomodoroForceBreak);
  const bool on_break = fx.core.pomodoro().state().mode == PomodoroMode::kBreak &&
                        fx.core.model().pose == PoseState::kLyingDown;
  const auto stopped = fx.core.Dispatch(Command::kStopPomodoro);
  return refused.status == CommandStatus::kNoOp && hint && stays_sitting &&
         again.status == CommandStatus::kNoOp && forced.ok() && on_break && stopped.ok() &&
         !fx.core.pomodoro().running() && fx.core.pomodoro().tick_timer() == kInvalidTimerId &&
         fx.core.pomodoro().CountdownLine().empty();
}

// Intent: countdown text is zero padded and never negative.
bool test_pomodoro_format() {
  return pawpal::core::format_mmss(1500) == "25:00" &&
         pawpal::core::format_mmss(61) == "01:01" &&
         pawpal::core::format_mmss(-3) == "00:00";
}

// Intent: a bubble anchored near a monitor edge is clamped inside that monitor.
bool test_bubble_clamped_near_edge() {
  const Rect primary{0, 0, 1920, 1080};
  const Rect right{1920, 0, 1280, 1024};
  const Rect near_right = BubblePositioner::ComputePlacement({1910, 50}, {200, 120}, 18, primary);
  const Rect near_seam = BubblePositioner::ComputePlacement({1925, 500}, {200, 120}, 18, right);
  const Rect centered = BubblePositioner::ComputePlacement({960, 600}, {200, 120}, 18, primary);
  return near_right == Rect{1720, 0, 200, 120} &&
         near_seam == Rect{1920, 362, 200, 120} &&
         centered == Rect{860, 462, 200, 120};
}

// Intent: a pet on the second monitor keeps its bubble on that monitor.
bool test_bubble_follows_pet_on_second_monitor() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.OnPointerPress(PointerButton::kLeft, {100, 100}, 0);
  (void)fx.core.OnPointerMove({3100, 20});
  (void)fx.core.OnPointerRelease(PointerButton::kLeft, {3100, 20}, 900);
  fx.core.OnDoubleClick();
  const Rect bubble = fx.core.bubble().frame();
  const Rect pet = fx.window.frame();
  return pet.x == 3080 && pet.y == 0 && fx.core.bubble().visible() &&
         bubble.left() >= 1920 && bubble.right() == 3200 && bubble.top() == 0;
}

// Intent: bubble width is clamped between its minimum and maximum; it hides itself on time.
bool test_bubble_width_and_auto_hide() {
  Scheduler scheduler;
  FakeScreens screens;
  FakeTextMeasurer measurer;
  EventLog log;
  BubblePositioner bubble(scheduler, screens, measurer, log);
  int closed = 0;
  bubble.AddClosedListener([&]() { ++closed; });

  BubbleContent shortish{};
  shortish.title = "Hi";
  bubble.Show(shortish, {500, 500}, 3200);
  const bool narrow = bubble.layout().total.width == 160;

  BubbleContent wide{};
  wide.title = "Note";
  wide.message = std::string(100, 'w');
  bubble.Show(wide, {500, 500}, 3200);
  const bool clamped = bubble.layout().total.width == 360 && bubble.layout().message.height == 48;

  (void)scheduler.Advance(3199);
  const bool still = bubble.visible();
  (void)scheduler.Advance(1);
  bubble.Close();
  return narrow && clamped && still && !bubble.visible() && closed == 1;
}

// Intent: a failed dynamic poll keeps the last line and polling continues.
bool test_bubble_dynamic_poll_failure_keeps_text() {
  Scheduler scheduler;
  FakeScreens screens;
  FakeTextMeasurer measurer;
  EventLog log;
  BubblePositioner bubble(scheduler, screens, measurer, log);

  int polls = 0;
  auto source = [&]() -> std::optional<std::string> {
    ++polls;
    if (polls == 2) {
      return std::nullopt;
    }
    return "line " + std::to_string(polls);
  };
  BubbleContent content{};
  content.title = "Countdown";
  bubble.Show(content, {500, 500}, 0, source, 100);
  const bool first = bubble.dynamic_text() == "line 1" && bubble.has_dynamic_line();
  (void)scheduler.Advance(249);
  const bool floor_respected = polls == 1;
  (void)scheduler.Advance(1);
  const bool kept = bubble.dynamic_text() == "line 1" && bubble.failed_poll_count() == 1 &&
                    bubble.refresh_timer() != kInvalidTimerId;
  (void)scheduler.Advance(250);
  return first && floor_respected && kept && bubble.dynamic_text() == "line 3" && bubble.visible();
}

// Intent: auto roundtrip does nothing while the pet is being dragged.
bool test_auto_roundtrip_skipped_while_dragging() {
  PetFixture fx(with(quiet_settings(), std::string(keys::kAutoRoundtripEnabled), "true"));
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.OnPointerPress(PointerButton::kLeft, {100, 100}, 0);
  const std::size_t shown = fx.core.bubble().shown_count();
  fx.core.behavior().FireAutoRoundtrip();
  return fx.core.model().pose == PoseState::kSitting && !fx.core.model().roundtrip.active &&
         fx.core.bubble().shown_count() == shown && !fx.core.behavior().AutoRoundtripIdle();
}

// Intent: the auto roundtrip timer starts a walk when the pet is idle.
bool test_auto_roundtrip_fires_when_idle() {
  PetFixture fx(with(quiet_settings(), std::string(keys::kAutoRoundtripEnabled), "true"));
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.Advance(30LL * 60 * 1000);
  return fx.core.model().roundtrip.active && pawpal::core::is_walking(fx.core.model().pose) &&
         bubble_titled(fx.core, "Auto walk");
}

// Intent: disabled chatter never speaks and never re-arms.
bool test_chatter_disabled_stays_silent() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  fx.random.fallback_unit = 0.0;
  const std::size_t shown = fx.core.bubble().shown_count();
  const std::size_t timers = fx.core.scheduler().active_count();
  for (int i = 0; i < 100; ++i) {
    fx.core.behavior().FireChatter();
  }
  return fx.core.bubble().shown_count() == shown &&
         fx.core.behavior().chatter_timer() == kInvalidTimerId &&
         fx.core.scheduler().active_count() == timers;
}

// Intent: enabled chatter speaks only on a lucky roll and always re-arms.
bool test_chatter_enabled_rolls_and_rearms() {
  PetFixture fx(with(quiet_settings(), std::string(keys::kChatterEnabled), "true"));
  if (!fx.start()) {
    return false;
  }
  const std::size_t shown = fx.core.bubble().shown_count();
  fx.random.units = {0.9, 0.1};
  fx.core.behavior().FireChatter();
  const bool unlucky = fx.core.bubble().shown_count() == shown &&
                       fx.core.behavior().chatter_timer() != kInvalidTimerId;
  fx.core.behavior().FireChatter();
  return unlucky && bubble_titled(fx.core, "Keep going") && fx.core.behavior().chatter_timer() != kInvalidTimerId;
}

// Intent: a user roundtrip request while resting is refused with a notice.
bool test_roundtrip_refused_while_lying() {
  PetFixture fx;
  if (!fx.start() || !fx.core.Dispatch(Command::kLieDownBreak).ok()) {
    return false;
  }
  const auto result = fx.core.Dispatch(walk_request(+1));
  return result.status == CommandStatus::kNoOp && result.message == "I'm resting right now." &&
         fx.core.bubble().content().message == "I'm resting right now." &&
         fx.core.model().pose == PoseState::kLyingDown && !fx.core.model().roundtrip.active;
}

// Intent: only preset scales are accepted; a valid one resizes and persists.
bool test_set_scale_presets_only() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  CommandRequest odd{};
  odd.command = Command::kSetScale;
  odd.scale = 0.6;
  const auto rejected = fx.core.Dispatch(odd);
  const bool unchanged = fx.window.size() == Size{120, 100} && bubble_titled(fx.core, "Scale");
  CommandRequest preset = odd;
  preset.scale = 1.25;
  const auto accepted = fx.core.Dispatch(preset);
  FakeAnimationSurface* sit = fx.surface(fx.paths.sit);
  return rejected.status == CommandStatus::kError && unchanged && accepted.ok() &&
         fx.window.size() == Size{150, 125} && sit != nullptr && sit->rendered == Size{150, 125} &&
         fx.settings.GetDouble(keys::kScale, 0.0) == 1.25;
}

// Intent: wheel scaling stays within the configured range.
bool test_wheel_scale_is_clamped() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  for (int i = 0; i < 20; ++i) {
    fx.core.OnWheel(1.0f);
  }
  const bool max_hit = fx.core.model().scale == 2.0 && fx.window.size() == Size{240, 200};
  for (int i = 0; i < 40; ++i) {
    fx.core.OnWheel(-1.0f);
  }
  return max_hit && std::abs(fx.core.model().scale - 0.3) < 1e-9 && fx.window.size() == Size{36, 30} &&
         frame_on_screen(fx);
}

// Intent: toggles flip their flag, persist it and announce the new state.
bool test_toggles_persist_and_announce() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  const int flushes = fx.settings.flush_count;
  (void)fx.core.Dispatch(Command::kToggleChatter);
  const bool chatter = fx.core.model().flags.chatter_enabled &&
                       fx.settings.GetBool(keys::kChatterEnabled, false) &&
                       bubble_titled(fx.core, "Random chatter") && fx.core.bubble().content().message == "ON" &&
                       fx.core.behavior().chatter_timer() != kInvalidTimerId;
  (void)fx.core.Dispatch(Command::kToggleAutoRoundtrip);
  const bool auto_walk = fx.core.model().flags.auto_roundtrip_enabled &&
                         fx.core.behavior().auto_roundtrip_timer() != kInvalidTimerId;
  (void)fx.core.Dispatch(Command::kToggleRest);
  const bool rest = fx.core.model().flags.rest_enabled && fx.core.behavior().rest_timer() != kInvalidTimerId;
  return chatter && auto_walk && rest && fx.settings.flush_count == flushes + 3;
}

// Intent: a failed settings flush is logged, not fatal.
bool test_flush_failure_is_logged() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  fx.settings.fail_flush = true;
  const auto result = fx.core.Dispatch(Command::kToggleLock);
  return result.ok() && fx.core.log().contains("[error] disk full");
}

// Intent: hiding the pet also hides its bubble; toggling brings it back.
bool test_hide_show_visibility() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.Dispatch(Command::kMotivate);
  const bool speaking = bubble_titled(fx.core, "Keep going");
  (void)fx.core.Dispatch(Command::kHide);
  const bool hidden = !fx.window.visible() && !fx.core.bubble().visible() && !fx.core.behavior().ChatterIdle();
  (void)fx.core.Dispatch(Command::kToggleVisible);
  const bool shown = fx.window.visible();
  (void)fx.core.Dispatch(Command::kQuit);
  return speaking && hidden && shown && fx.core.quit_requested();
}

// Intent: persisted flags and scale are restored at startup.
bool test_persisted_state_restored() {
  SettingsMap seed = quiet_settings();
  seed[std::string(keys::kLocked)] = "true";
  seed[std::string(keys::kScale)] = "1.25";
  seed[std::string(keys::kRestIntervalMinutes)] = "0";
  PetFixture fx(seed);
  if (!fx.start()) {
    return false;
  }
  const auto& model = fx.core.model();
  return model.flags.locked && !model.flags.chatter_enabled && model.scale == 1.25 &&
         model.rest_interval_minutes == 1 && fx.window.size() == Size{150, 125};
}

}  // namespace

// Intent: RunUntil takes an absolute time that never rewinds; Advance steps by a delta.
bool test_core_clock_absolute_and_delta() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.Advance(100);
  const bool stepped = fx.core.scheduler().now_ms() == 100;
  (void)fx.core.RunUntil(50);
  const bool no_rewind = fx.core.scheduler().now_ms() == 100;
  (void)fx.core.RunUntil(300);
  (void)fx.core.Advance(25);
  return stepped && no_rewind && fx.core.scheduler().now_ms() == 325;
}

// Intent: a non-finite persisted or requested scale never reaches the window size.
bool test_non_finite_scale_ignored() {
  PetFixture fx(with(quiet_settings(), std::string(keys::kScale), "nan"));
  if (!fx.start()) {
    return false;
  }
  const bool restored = fx.core.model().scale == 1.0 && fx.window.size() == Size{120, 100};
  const double applied = fx.core.state_machine().ApplyScale(std::numeric_limits<double>::infinity());
  return restored && applied == 1.0 && fx.core.model().scale == 1.0 && fx.window.size() == Size{120, 100} &&
         fx.core.log().contains("non-finite scale");
}

// Intent: a running pomodoro refuses a manual roundtrip with a notice.
bool test_roundtrip_refused_during_pomodoro() {
  PetFixture fx;
  if (!fx.start() || !fx.core.Dispatch(Command::kStartPomodoro).ok()) {
    return false;
  }
  const auto result = fx.core.Dispatch(walk_request(+1));
  return result.status == CommandStatus::kNoOp && result.message == "Not during a pomodoro." &&
         fx.core.bubble().content().message == "Not during a pomodoro." &&
         fx.core.model().pose == PoseState::kSitting && !fx.core.model().roundtrip.active;
}

// Intent: a held pet refuses a manual roundtrip with a notice.
bool test_roundtrip_refused_while_dragging() {
  PetFixture fx;
  if (!fx.start()) {
    return false;
  }
  (void)fx.core.OnPointerPress(PointerButton::kLeft, {100, 100}, 0);
  const auto result = fx.core.Dispatch(walk_request(-1));
  return result.status == CommandStatus::kNoOp && result.message == "Let go of me first." &&
         fx.core.bubble().content().message == "Let go of me first." &&
         fx.core.model().pose == PoseState::kSitting && !fx.core.model().roundtrip.active;
}

// Intent: a second roundtrip request while walking keeps the current walk.
bool test_roundtrip_refused_while_walking() {
  PetFixture fx;
  if (!fx.start() || !fx.core.Dispatch(walk_request(+1)).ok()) {
    return false;
  }
  const auto result = fx.core.Dispatch(walk_request(-1));
  const auto& model = fx.core.model();
  return result.status == CommandStatus::kNoOp && result.message == "Already walking." &&
         model.pose == PoseState::kWalkingRight && model.roundtrip.active && model.roundtrip.direction == +1 &&
         model.roundtrip.edge_hits_remaining == 2;
}

// Intent: the auto roundtrip stays quiet while a pomodoro runs.
bool test_auto_roundtrip_skipped_during_pomodoro() {
  PetFixture fx(with(quiet_settings(), std::string(keys::kAutoRoundtripEnabled), "true"));
  if (!fx.start() || !fx.core.Dispatch(Command::kStartPomodoro).ok()) {
    return false;
  }
  const std::size_t shown = fx.core.bubble().shown_count();
  fx.core.behavior().FireAutoRoundtrip();
  return fx.core.model().pose == PoseState::kSitting && !fx.core.model().roundtrip.active &&
         fx.core.bubble().shown_count() == shown && !fx.core.behavior().AutoRoundtripIdle();
}

int main() {
  const std::vector<TestCase> tests = {
      {"Scheduler_OrderByTime", "Due entries fire by time then arming order", test_scheduler_orders_by_time_then_arming},
      {"Scheduler_Cancel", "Cancelled and self-cancelled timers stop firing", test_scheduler_cancel_and_self_cancel},
      {"Scheduler_VirtualTime", "Virtual time steps to each fire time", test_scheduler_virtual_time_steps},
      {"Settings_Coercion", "Malformed values fall back to defaults", test_settings_coercion_falls_back},
      {"Settings_IniLoadFlush", "Ini store skips junk and persists writes", test_ini_settings_load_and_flush},
      {"Config_TuningClamped", "Tuning keys override and clamp defaults", test_config_tuning_keys_clamped},
      {"Core_ClockAbsoluteAndDelta", "RunUntil is absolute and Advance is a delta", test_core_clock_absolute_and_delta},
      {"Settings_NonFiniteScale", "Non-finite scales never resize the pet", test_non_finite_scale_ignored},
      {"EventLog_Bounded", "Log keeps only the newest lines", test_event_log_is_bounded},
      {"Startup_MissingAssetFatal", "Missing asset fails startup and arms nothing", test_missing_asset_is_fatal},
      {"Startup_LoadAndGreet", "Poses load uniformly and the pet greets", test_startup_loads_poses_and_greets},
      {"Startup_ClampPersistedPosition", "Persisted off-screen position is clamped", test_startup_clamps_persisted_position},
      {"Startup_DelayedOnScreenCheck", "Delayed check pulls the window back", test_startup_delayed_on_screen_check},
      {"Startup_PersistedState", "Flags and scale are restored", test_persisted_state_restored},
      {"Roundtrip_RequestedDirection", "Roundtrip walks the requested way", test_roundtrip_starts_in_requested_direction},
      {"Roundtrip_RandomDirection", "Direction 0 asks the random source", test_roundtrip_random_direction},
      {"Roundtrip_RefusedWhileLying", "Resting pet refuses to walk", test_roundtrip_refused_while_lying},
      {"Roundtrip_RefusedDuringPomodoro", "Running pomodoro refuses a walk", test_roundtrip_refused_during_pomodoro},
      {"Roundtrip_RefusedWhileDragging", "Held pet refuses a walk", test_roundtrip_refused_while_dragging},
      {"Roundtrip_RefusedWhileWalking", "Walking pet keeps its walk", test_roundtrip_refused_while_walking},
      {"Walk_Accumulator", "Step sum stays within one pixel", test_walk_accumulator_sums_within_one_px},
      {"Walk_FirstEdgeReverses", "First edge reverses the walk", test_walk_first_edge_reverses},
      {"Walk_RoundtripCompletes", "Roundtrip stays on screen and ends sitting", test_walk_roundtrip_completes_on_screen},
      {"Walk_PausedWhileDragging", "Ticks leave a dragged window alone", test_walk_pauses_while_dragging},
      {"Rest_PreemptsRoundtrip", "Rest reminder ends a roundtrip", test_rest_preempts_roundtrip},
      {"Rest_FiresOnInterval", "Rest reminder fires once per interval", test_rest_reminder_fires_on_interval},
      {"Rest_SnoozeResume", "Snooze pauses then resumes the reminder", test_rest_snooze_and_resume},
      {"Drag_ClickVsDrag", "Click and drag are told apart", test_drag_click_versus_drag},
      {"Drag_SlowPress", "Slow still press is not a click", test_drag_slow_press_is_not_click},
      {"Drag_Snap", "Drop near an edge snaps to it", test_drag_snaps_to_nearby_edge},
      {"Drag_LockedClick", "Locked pet stays put and hints", test_drag_locked_click},
      {"Pointer_ContextMenu", "Right press opens the context menu", test_right_press_opens_menu},
      {"Pointer_DoubleClick", "Double click toggles sit and lie", test_double_click_toggles_pose},
      {"Pomodoro_WorkThenBreak", "Work ends in break and break in work", test_pomodoro_work_then_break},
      {"Pomodoro_ForceRequiresRunning", "Forced phases need a running pomodoro", test_pomodoro_force_requires_running},
      {"Pomodoro_Format", "Countdown text is zero padded", test_pomodoro_format},
      {"Bubble_ClampedNearEdge", "Bubble is clamped into its monitor", test_bubble_clamped_near_edge},
      {"Bubble_SecondMonitor", "Bubble stays on the pet's monitor", test_bubble_follows_pet_on_second_monitor},
      {"Bubble_WidthAndAutoHide", "Bubble width is clamped and it hides on time", test_bubble_width_and_auto_hide},
      {"Bubble_DynamicPollFailure", "Failed poll keeps the last line", test_bubble_dynamic_poll_failure_keeps_text},
      {"Behavior_AutoRoundtripDragging", "Auto walk skipped while dragging", test_auto_roundtrip_skipped_while_dragging},
      {"Behavior_AutoRoundtripPomodoro", "Auto walk skipped during a pomodoro", test_auto_roundtrip_skipped_during_pomodoro},
      {"Behavior_AutoRoundtripIdle", "Auto walk starts when idle", test_auto_roundtrip_fires_when_idle},
      {"Behavior_ChatterDisabled", "Disabled chatter stays silent", test_chatter_disabled_stays_silent},
      {"Behavior_ChatterEnabled", "Enabled chatter rolls and re-arms", test_chatter_enabled_rolls_and_rearms},
      {"Command_SetScale", "Only preset scales are accepted", test_set_scale_presets_only},
      {"Command_WheelScale", "Wheel scaling is clamped", test_wheel_scale_is_clamped},
      {"Command_Toggles", "Toggles persist and announce", test_toggles_persist_and_announce},
      {"Command_FlushFailure", "Flush failure is logged", test_flush_failure_is_logged},
      {"Command_Visibility", "Hide, show and quit", test_hide_show_visibility},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}

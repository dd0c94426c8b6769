#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "imgui.h"
#include "raylib.h"
#include "rlImGui.h"
#include "pawpal/core/config.hpp"
#include "pawpal/core/pet_core.hpp"
#include "pawpal/core/random_source.hpp"
#include "pawpal/core/services.hpp"
#include "pawpal/core/settings.hpp"

namespace {

using pawpal::core::AnimationSurface;
using pawpal::core::BubbleButton;
using pawpal::core::Command;
using pawpal::core::CommandRequest;
using pawpal::core::OpResult;
using pawpal::core::PetCore;
using pawpal::core::Point;
using pawpal::core::PointerButton;
using pawpal::core::PointerOutcome;
using pawpal::core::PoseState;
using pawpal::core::Rect;
using pawpal::core::Size;
using pawpal::core::TextRole;

constexpr const char* kSettingsFile = "pawpal_state.ini";
constexpr int kBadgeSize = 26;
constexpr int kMenuWidth = 240;
constexpr int kMenuHeight = 470;
constexpr int kDiagnosticsWidth = 420;
constexpr int kDiagnosticsHeight = 320;
constexpr std::int64_t kDoubleClickMs = 300;
// raylib exposes no per-frame GIF delays; assets are authored at 10 fps.
constexpr float kGifFrameMs = 100.0f;

std::int64_t NowMs() {
  return static_cast<std::int64_t>(GetTime() * 1000.0);
}

Point GlobalMouse() {
  const Vector2 window = GetWindowPosition();
  const Vector2 mouse = GetMousePosition();
  return {static_cast<int>(window.x + mouse.x), static_cast<int>(window.y + mouse.y)};
}

ImVec2 ToLocal(const Point& global, const Point& origin) {
  return ImVec2(static_cast<float>(global.x - origin.x), static_cast<float>(global.y - origin.y));
}

// ---------------------------------------------------------------------------
// Platform services

class MonitorGeometry final : public pawpal::core::ScreenGeometryProvider {
 public:
  void Refresh() {
    monitors_.clear();
    const int count = GetMonitorCount();
    for (int i = 0; i < count; ++i) {
      const Vector2 pos = GetMonitorPosition(i);
      monitors_.push_back({static_cast<int>(pos.x), static_cast<int>(pos.y), GetMonitorWidth(i), GetMonitorHeight(i)});
    }
    if (monitors_.empty()) {
      monitors_.push_back({0, 0, 1280, 720});
    }
  }

  Rect AvailableRectAt(const Point& point) const override {
    for (const Rect& monitor : monitors_) {
      if (monitor.contains(point)) {
        return monitor;
      }
    }
    return monitors_.empty() ? Rect{0, 0, 1280, 720} : monitors_.front();
  }

  [[nodiscard]] std::size_t count() const { return monitors_.size(); }

 private:
  std::vector<Rect> monitors_{};
};

// Logical pet rectangle in virtual-desktop coordinates. The OS window is sized around
// it every frame (see HostLayout).
class OverlayPetWindow final : public pawpal::core::PetWindow {
 public:
  Point position() const override { return position_; }
  Size size() const override { return size_; }
  bool visible() const override { return visible_; }
  void Move(const Point& top_left) override { position_ = top_left; }
  void Resize(const Size& size) override { size_ = size; }
  void SetVisible(bool visible) override { visible_ = visible; }

 private:
  Point position_{};
  Size size_{128, 128};
  bool visible_ = true;
};

class GifAnimation final : public AnimationSurface {
 public:
  GifAnimation(Image frames, int frame_count)
      : frames_(frames), frame_count_(std::max(1, frame_count)), texture_(LoadTextureFromImage(frames)) {}

  ~GifAnimation() override {
    UnloadTexture(texture_);
    UnloadImage(frames_);
  }

  GifAnimation(const GifAnimation&) = delete;
  GifAnimation& operator=(const GifAnimation&) = delete;

  void Start() override { playing_ = true; }
  void Stop() override { playing_ = false; }
  bool playing() const override { return playing_; }
  Size current_frame_size() const override { return {frames_.width, frames_.height}; }
  void SetPlaybackSpeedPercent(int percent) override { speed_percent_ = std::max(1, percent); }
  void SetRenderedSize(const Size& size) override { rendered_ = size; }

  void Advance(float dt_ms) {
    if (!playing_ || frame_count_ <= 1) {
      return;
    }
    elapsed_ms_ += dt_ms * static_cast<float>(speed_percent_) / 100.0f;
    bool changed = false;
    while (elapsed_ms_ >= kGifFrameMs) {
      elapsed_ms_ -= kGifFrameMs;
      frame_ = (frame_ + 1) % frame_count_;
      changed = true;
    }
    if (changed) {
      // LoadImageAnim stores frames back to back as RGBA8.
      const std::size_t frame_bytes = static_cast<std::size_t>(frames_.width) * frames_.height * 4;
      UpdateTexture(texture_, static_cast<unsigned char*>(frames_.data) + frame_bytes * frame_);
    }
  }

  void Draw(const Point& top_left) const {
    const Size size = rendered_.empty() ? current_frame_size() : rendered_;
    const Rectangle source{0.0f, 0.0f, static_cast<float>(frames_.width), static_cast<float>(frames_.height)};
    const Rectangle dest{static_cast<float>(top_left.x), static_cast<float>(top_left.y),
                         static_cast<float>(size.width), static_cast<float>(size.height)};
    DrawTexturePro(texture_, source, dest, Vector2{0.0f, 0.0f}, 0.0f, WHITE);
  }

 private:
  Image frames_{};
  int frame_count_ = 1;
  Texture2D texture_{};
  int frame_ = 0;
  float elapsed_ms_ = 0.0f;
  int speed_percent_ = 100;
  bool playing_ = false;
  Size rendered_{};
};

class GifAnimationLoader final : public pawpal::core::AnimationLoader {
 public:
  OpResult<std::unique_ptr<AnimationSurface>> Load(const std::string& path) override {
    OpResult<std::unique_ptr<AnimationSurface>> result;
    if (!FileExists(path.c_str())) {
      result.error = "file not found";
      return result;
    }
    int frames = 0;
    Image image = LoadImageAnim(path.c_str(), &frames);
    if (image.data == nullptr || frames <= 0) {
      result.error = "cannot decode animation";
      return result;
    }
    auto surface = std::make_unique<GifAnimation>(image, frames);
    surfaces_.push_back(surface.get());
    result.ok = true;
    result.value = std::move(surface);
    return result;
  }

  // Surfaces are owned by the state machine, which outlives every call made here.
  void AdvanceAll(float dt_ms) {
    for (GifAnimation* surface : surfaces_) {
      surface->Advance(dt_ms);
    }
  }

 private:
  std::vector<GifAnimation*> surfaces_{};
};

// One font for every role; titles only differ in color.
class ImGuiTextMeasurer final : public pawpal::core::TextMeasurer {
 public:
  Size MeasureText(std::string_view text, TextRole, int wrap_width) const override {
    if (text.empty()) {
      return {};
    }
    const ImVec2 size =
        ImGui::CalcTextSize(text.data(), text.data() + text.size(), false, static_cast<float>(wrap_width));
    return {static_cast<int>(std::ceil(size.x)), static_cast<int>(std::ceil(size.y))};
  }

  Size MeasureButtonRow(const std::vector<std::string>& labels) const override {
    const ImGuiStyle& style = ImGui::GetStyle();
    float width = 0.0f;
    float height = 0.0f;
    for (std::size_t i = 0; i < labels.size(); ++i) {
      const ImVec2 text = ImGui::CalcTextSize(labels[i].c_str());
      width += text.x + style.FramePadding.x * 2.0f;
      if (i > 0) {
        width += style.ItemSpacing.x;
      }
      height = std::max(height, text.y + style.FramePadding.y * 2.0f);
    }
    return {static_cast<int>(std::ceil(width)), static_cast<int>(std::ceil(height))};
  }
};

// ---------------------------------------------------------------------------
// Shell state

struct ShellUiState {
  bool menu_requested = false;
  bool menu_open = false;
  Point menu_at{};
  bool show_diagnostics = false;
  bool pointer_on_pet = false;
  std::int64_t last_click_ms = -1;
  Point last_click_at{};
  Rect host{};
  Texture2D tray_icon{};
  bool has_tray_icon = false;
};

Rect BadgeRect(const OverlayPetWindow& window) {
  const Rect pet = window.frame();
  return {pet.right() - kBadgeSize, pet.bottom() - kBadgeSize, kBadgeSize, kBadgeSize};
}

Rect MenuRect(const ShellUiState& ui, const MonitorGeometry& screens) {
  const Rect monitor = screens.AvailableRectAt(ui.menu_at);
  return {pawpal::core::clamp_span(ui.menu_at.x, kMenuWidth, monitor.left(), monitor.right()),
          pawpal::core::clamp_span(ui.menu_at.y, kMenuHeight, monitor.top(), monitor.bottom()), kMenuWidth,
          kMenuHeight};
}

Rect DiagnosticsRect(const OverlayPetWindow& window, const MonitorGeometry& screens) {
  const Rect pet = window.frame();
  const Rect monitor = screens.AvailableRectAt(pet.center());
  const int x = pet.right() + 8;
  return {pawpal::core::clamp_span(x, kDiagnosticsWidth, monitor.left(), monitor.right()),
          pawpal::core::clamp_span(pet.y, kDiagnosticsHeight, monitor.top(), monitor.bottom()), kDiagnosticsWidth,
          kDiagnosticsHeight};
}

// The OS window covers everything that has to be drawn this frame. A hidden pet
// leaves only the tray badge.
Rect HostLayout(const PetCore& core, const OverlayPetWindow& window, const ShellUiState& ui,
                const MonitorGeometry& screens) {
  Rect host = BadgeRect(window);
  if (window.visible()) {
    host = pawpal::core::united(host, window.frame());
    if (core.bubble().visible()) {
      host = pawpal::core::united(host, core.bubble().frame());
    }
  }
  if (ui.menu_open || ui.menu_requested) {
    host = pawpal::core::united(host, MenuRect(ui, screens));
  }
  if (ui.show_diagnostics) {
    host = pawpal::core::united(host, DiagnosticsRect(window, screens));
  }
  return host;
}

void ApplyHostLayout(ShellUiState& ui, const Rect& host) {
  if (host == ui.host) {
    return;
  }
  if (host.top_left() != ui.host.top_left()) {
    SetWindowPosition(host.x, host.y);
  }
  if (host.size() != ui.host.size()) {
    SetWindowSize(std::max(1, host.width), std::max(1, host.height));
  }
  ui.host = host;
}

// ---------------------------------------------------------------------------
// Input

void HandleBadgeInput(PetCore& core, ShellUiState& ui, const Point& mouse) {
  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    (void)core.Dispatch(Command::kToggleVisible);
  } else if (IsMouseButtonPressed(MOUSE_BUTTON_RIGHT)) {
    ui.menu_requested = true;
    ui.menu_at = mouse;
  }
}

void HandlePetInput(PetCore& core, const OverlayPetWindow& window, ShellUiState& ui) {
  if (ImGui::GetIO().WantCaptureMouse && !core.drag().dragging()) {
    return;
  }
  const Point mouse = GlobalMouse();
  const std::int64_t now = NowMs();
  const bool over_badge = BadgeRect(window).contains(mouse);
  const bool over_pet = window.visible() && window.frame().contains(mouse);

  if (over_badge && !core.drag().dragging()) {
    HandleBadgeInput(core, ui, mouse);
    return;
  }

  if (over_pet) {
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
      ui.pointer_on_pet = true;
      (void)core.OnPointerPress(PointerButton::kLeft, mouse, now);
    }
    if (IsMouseButtonPressed(MOUSE_BUTTON_RIGHT) &&
        core.OnPointerPress(PointerButton::kRight, mouse, now) == PointerOutcome::kContextMenu) {
      ui.menu_requested = true;
      ui.menu_at = mouse;
    }
    const float wheel = GetMouseWheelMove();
    if (wheel != 0.0f) {
      core.OnWheel(wheel);
    }
  }

  if (!ui.pointer_on_pet) {
    return;
  }
  const Vector2 delta = GetMouseDelta();
  if (delta.x != 0.0f || delta.y != 0.0f) {
    (void)core.OnPointerMove(mouse);
  }
  if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) {
    ui.pointer_on_pet = false;
    const PointerOutcome outcome = core.OnPointerRelease(PointerButton::kLeft, mouse, now);
    if (outcome != PointerOutcome::kClick) {
      return;
    }
    const bool second = ui.last_click_ms >= 0 && now - ui.last_click_ms <= kDoubleClickMs &&
                        pawpal::core::manhattan_length(mouse - ui.last_click_at) <= core.config().drag.threshold_px;
    if (second) {
      ui.last_click_ms = -1;
      core.OnDoubleClick();
    } else {
      ui.last_click_ms = now;
      ui.last_click_at = mouse;
    }
  }
}

// ---------------------------------------------------------------------------
// Drawing

void DrawBubble(PetCore& core, const Point& origin) {
  const auto& bubble = core.bubble();
  if (!bubble.visible() || !core.window().visible()) {
    return;
  }
  const auto& cfg = bubble.config();
  const Rect frame = bubble.frame();
  const int body_h = frame.height - cfg.tail_height;
  const int content_w = bubble.layout().content_width;

  ImGui::SetNextWindowPos(ToLocal(frame.top_left(), origin), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(static_cast<float>(frame.width), static_cast<float>(frame.height)),
                           ImGuiCond_Always);
  ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding,
                      ImVec2(static_cast<float>(cfg.pad_x), static_cast<float>(cfg.pad_y)));
  ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing,
                      ImVec2(ImGui::GetStyle().ItemSpacing.x, static_cast<float>(cfg.spacing)));
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                 ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBackground |
                                 ImGuiWindowFlags_NoFocusOnAppearing;
  std::vector<CommandRequest> clicked;
  if (ImGui::Begin("##bubble", nullptr, flags)) {
    ImDrawList* draw = ImGui::GetWindowDrawList();
    const ImVec2 p0 = ImGui::GetWindowPos();
    const ImVec2 p1(p0.x + static_cast<float>(frame.width), p0.y + static_cast<float>(body_h));
    draw->AddRectFilled(p0, p1, IM_COL32(255, 250, 240, 245), 10.0f);
    draw->AddRect(p0, p1, IM_COL32(60, 50, 40, 200), 10.0f);

    // Tail points at the anchor, kept inside the body.
    const float half_tail = static_cast<float>(cfg.tail_width) * 0.5f;
    const float anchor_x = static_cast<float>(bubble.model().anchor.x - origin.x);
    const float tail_x = std::clamp(anchor_x, p0.x + 12.0f + half_tail, p1.x - 12.0f - half_tail);
    draw->AddTriangleFilled(ImVec2(tail_x - half_tail, p1.y - 1.0f), ImVec2(tail_x + half_tail, p1.y - 1.0f),
                            ImVec2(tail_x, p1.y + static_cast<float>(cfg.tail_height)),
                            IM_COL32(255, 250, 240, 245));

    ImGui::PushTextWrapPos(ImGui::GetCursorPosX() + static_cast<float>(content_w));
    const auto& content = bubble.content();
    if (!content.title.empty()) {
      ImGui::TextColored(ImVec4(0.55f, 0.25f, 0.10f, 1.0f), "%s", content.title.c_str());
    }
    if (!content.message.empty()) {
      ImGui::TextColored(ImVec4(0.15f, 0.12f, 0.10f, 1.0f), "%s", content.message.c_str());
    }
    if (bubble.has_dynamic_line()) {
      ImGui::TextColored(ImVec4(0.10f, 0.35f, 0.55f, 1.0f), "%s", bubble.dynamic_text().c_str());
    }
    ImGui::PopTextWrapPos();

    if (!content.buttons.empty()) {
      ImGui::Dummy(ImVec2(0.0f, static_cast<float>(cfg.button_row_margin - cfg.spacing)));
      for (std::size_t i = 0; i < content.buttons.size(); ++i) {
        const BubbleButton& button = content.buttons[i];
        ImGui::PushID(static_cast<int>(i));
        if (ImGui::Button(button.label.c_str())) {
          clicked.push_back(button.request);
        }
        ImGui::PopID();
        ImGui::SameLine();
      }
      if (ImGui::Button("x")) {
        CommandRequest close{};
        close.command = Command::kCloseBubble;
        clicked.push_back(close);
      }
    }
  }
  ImGui::End();
  ImGui::PopStyleVar(2);

  // Buttons change the bubble content, so they run after it was drawn.
  for (const CommandRequest& request : clicked) {
    (void)core.Dispatch(request);
  }
}

void MenuCommand(PetCore& core, const char* label, Command command, bool selected = false) {
  if (ImGui::MenuItem(label, nullptr, selected)) {
    (void)core.Dispatch(command);
  }
}

void DrawContextMenu(PetCore& core, ShellUiState& ui, const MonitorGeometry& screens, const Point& origin) {
  if (ui.menu_requested) {
    ImGui::OpenPopup("pet_menu");
    ui.menu_requested = false;
    ui.menu_open = true;
  }
  const Rect menu = MenuRect(ui, screens);
  ImGui::SetNextWindowPos(ToLocal(menu.top_left(), origin), ImGuiCond_Always);
  if (!ImGui::BeginPopup("pet_menu")) {
    ui.menu_open = false;
    return;
  }
  const auto& model = core.model();
  MenuCommand(core, "Show", Command::kShow);
  MenuCommand(core, "Hide", Command::kHide);
  ImGui::Separator();
  MenuCommand(core, "Sit (Focus)", Command::kSitFocus, model.pose == PoseState::kSitting);
  MenuCommand(core, "Lie down (Break)", Command::kLieDownBreak, model.pose == PoseState::kLyingDown);
  MenuCommand(core, "Motivate me", Command::kMotivate);
  MenuCommand(core, "Walk roundtrip", Command::kWalkRoundtrip, model.roundtrip.active);
  ImGui::Separator();
  ImGui::TextDisabled("Pomodoro");
  MenuCommand(core, "Start (25/5)", Command::kStartPomodoro, model.pomodoro.running);
  MenuCommand(core, "Stop", Command::kStopPomodoro);
  MenuCommand(core, "Start break now", Command::kPomodoroForceBreak);
  MenuCommand(core, "Back to focus", Command::kPomodoroForceWork);
  {
    const std::string snooze = "Snooze rest " + std::to_string(core.config().behavior.snooze_minutes) + " min";
    MenuCommand(core, snooze.c_str(), Command::kSnoozeRest);
  }
  ImGui::Separator();
  MenuCommand(core, "Auto roundtrip (30 min)", Command::kToggleAutoRoundtrip, model.flags.auto_roundtrip_enabled);
  MenuCommand(core, "Rest reminder", Command::kToggleRest, model.flags.rest_enabled);
  MenuCommand(core, "Random chatter", Command::kToggleChatter, model.flags.chatter_enabled);
  MenuCommand(core, "Lock position", Command::kToggleLock, model.flags.locked);
  ImGui::Separator();
  for (double preset : pawpal::core::kScalePresets) {
    const std::string label = "Scale " + std::to_string(static_cast<int>(std::lround(preset * 100.0))) + "%";
    if (ImGui::MenuItem(label.c_str(), nullptr, std::fabs(model.scale - preset) < 1e-3)) {
      CommandRequest request{};
      request.command = Command::kSetScale;
      request.scale = preset;
      (void)core.Dispatch(request);
    }
  }
  ImGui::Separator();
  MenuCommand(core, "Close bubble", Command::kCloseBubble);
  if (ImGui::MenuItem("Diagnostics", "F12", ui.show_diagnostics)) {
    ui.show_diagnostics = !ui.show_diagnostics;
  }
  MenuCommand(core, "Quit", Command::kQuit);
  ImGui::EndPopup();
}

void DrawDiagnosticsWindow(PetCore& core, const OverlayPetWindow& window, const MonitorGeometry& screens,
                           ShellUiState& ui, const Point& origin) {
  if (!ui.show_diagnostics) {
    return;
  }
  const Rect area = DiagnosticsRect(window, screens);
  ImGui::SetNextWindowPos(ToLocal(area.top_left(), origin), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(static_cast<float>(area.width), static_cast<float>(area.height)), ImGuiCond_Always);
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
  if (!ImGui::Begin("Diagnostics", &ui.show_diagnostics, flags)) {
    ImGui::End();
    return;
  }
  const auto& model = core.model();
  ImGui::Text("pose: %s  scale: %.2f", pawpal::core::pose_label(model.pose), model.scale);
  ImGui::Text("roundtrip: %s dir=%d edges=%d", model.roundtrip.active ? "on" : "off", model.roundtrip.direction,
              model.roundtrip.edge_hits_remaining);
  ImGui::Text("pomodoro: %s %s", model.pomodoro.running ? "running" : "stopped",
              core.pomodoro().CountdownLine().c_str());
  ImGui::Text("timers: %zu  monitors: %zu  pos: %d,%d", core.scheduler().active_count(), screens.count(),
              window.position().x, window.position().y);
  const auto next_due = core.scheduler().next_due_ms();
  const long long next_in = next_due.has_value() ? static_cast<long long>(*next_due - core.scheduler().now_ms()) : -1;
  ImGui::Text("next timer in: %lld ms  transitions: %zu", next_in, core.state_machine().transition_count());
  ImGui::Separator();
  if (ImGui::BeginChild("log", ImVec2(0.0f, 0.0f), true)) {
    for (const std::string& line : core.log().lines()) {
      ImGui::TextUnformatted(line.c_str());
    }
    if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) {
      ImGui::SetScrollHereY(1.0f);
    }
  }
  ImGui::EndChild();
  ImGui::End();
}

void DrawTrayBadge(const OverlayPetWindow& window, const ShellUiState& ui, const Point& origin) {
  const Rect badge = BadgeRect(window);
  const int x = badge.x - origin.x;
  const int y = badge.y - origin.y;
  if (ui.has_tray_icon) {
    const Rectangle source{0.0f, 0.0f, static_cast<float>(ui.tray_icon.width), static_cast<float>(ui.tray_icon.height)};
    const Rectangle dest{static_cast<float>(x), static_cast<float>(y), static_cast<float>(kBadgeSize),
                         static_cast<float>(kBadgeSize)};
    DrawTexturePro(ui.tray_icon, source, dest, Vector2{0.0f, 0.0f}, 0.0f, WHITE);
    return;
  }
  const float radius = static_cast<float>(kBadgeSize) * 0.5f;
  DrawCircle(x + kBadgeSize / 2, y + kBadgeSize / 2, radius, Color{120, 80, 50, 220});
  DrawText("P", x + kBadgeSize / 2 - 4, y + kBadgeSize / 2 - 8, 16, RAYWHITE);
}

void DrawPet(const PetCore& core, const OverlayPetWindow& window, const Point& origin) {
  if (!window.visible()) {
    return;
  }
  const auto* active = dynamic_cast<const GifAnimation*>(core.state_machine().active_animation());
  if (active != nullptr) {
    active->Draw(window.position() - origin);
  }
}

void StorePosition(pawpal::core::SettingsStore& settings, const OverlayPetWindow& window) {
  settings.SetInt(pawpal::core::settings_keys::kPosX, window.position().x);
  settings.SetInt(pawpal::core::settings_keys::kPosY, window.position().y);
}

int RunPet(pawpal::core::IniSettingsStore& settings, ShellUiState& ui) {
  MonitorGeometry screens;
  screens.Refresh();
  OverlayPetWindow window;
  ImGuiTextMeasurer measurer;
  pawpal::core::MersenneRandomSource random;
  GifAnimationLoader loader;

  PetCore core(screens, window, measurer, settings, random, pawpal::core::LoadPetConfig(settings),
               NowMs());
  const pawpal::core::AssetPaths paths = pawpal::core::ResolveAssetPaths(GetApplicationDirectory());
  const auto initialized = core.Initialize(loader, paths);
  if (!initialized.ok) {
    std::fprintf(stderr, "pawpal: %s\n", initialized.error.c_str());
    return 1;
  }
  if (FileExists(paths.tray_icon.c_str())) {
    ui.tray_icon = LoadTexture(paths.tray_icon.c_str());
    ui.has_tray_icon = ui.tray_icon.id != 0;
  }
  ClearWindowState(FLAG_WINDOW_HIDDEN);

  std::int64_t monitors_checked_ms = NowMs();
  while (!WindowShouldClose() && !core.quit_requested()) {
    const std::int64_t now = NowMs();
    if (now - monitors_checked_ms >= 2000) {
      screens.Refresh();
      monitors_checked_ms = now;
    }
    ApplyHostLayout(ui, HostLayout(core, window, ui, screens));
    const Point origin = ui.host.top_left();

    BeginDrawing();
    ClearBackground(BLANK);
    rlImGuiBegin();

    if (IsKeyPressed(KEY_F12)) {
      ui.show_diagnostics = !ui.show_diagnostics;
    }
    HandlePetInput(core, window, ui);
    (void)core.RunUntil(now);
    loader.AdvanceAll(GetFrameTime() * 1000.0f);

    DrawPet(core, window, origin);
    DrawTrayBadge(window, ui, origin);
    DrawBubble(core, origin);
    DrawContextMenu(core, ui, screens, origin);
    DrawDiagnosticsWindow(core, window, screens, ui, origin);

    rlImGuiEnd();
    EndDrawing();
  }

  StorePosition(settings, window);
  const auto flushed = settings.Flush();
  if (!flushed.ok) {
    std::fprintf(stderr, "pawpal: %s\n", flushed.error.c_str());
  }
  if (ui.has_tray_icon) {
    UnloadTexture(ui.tray_icon);
  }
  return 0;
}

}  // namespace

int main() {
  pawpal::core::IniSettingsStore settings(kSettingsFile);
  const auto loaded = settings.Load();
  if (!loaded.ok) {
    std::fprintf(stderr, "pawpal: %s\n", loaded.error.c_str());
  }

  SetConfigFlags(FLAG_WINDOW_UNDECORATED | FLAG_WINDOW_TRANSPARENT | FLAG_WINDOW_TOPMOST | FLAG_WINDOW_HIDDEN |
                 FLAG_VSYNC_HINT);
  InitWindow(128, 128, "pawpal");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  rlImGuiSetup(true);
  ImGui::StyleColorsLight();
  {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 6.0f;
    style.FrameRounding = 4.0f;
    style.PopupRounding = 4.0f;
    style.WindowBorderSize = 0.0f;
    style.FrameBorderSize = 0.0f;
  }
  ImGui::GetIO().IniFilename = nullptr;

  ShellUiState ui;
  const int exit_code = RunPet(settings, ui);

  rlImGuiShutdown();
  CloseWindow();
  return exit_code;
}

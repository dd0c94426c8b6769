#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "pawpal/core/config.hpp"
#include "pawpal/core/entities.hpp"
#include "pawpal/core/event_log.hpp"
#include "pawpal/core/id.hpp"
#include "pawpal/core/scheduler.hpp"
#include "pawpal/core/services.hpp"
#include "pawpal/core/types.hpp"

namespace pawpal::core {

struct BubbleLayout {
  int content_width = 0;
  Size title{};
  Size message{};
  Size dynamic{};
  Size buttons{};
  Size total{};
};

struct BubbleModel {
  Point anchor{};
  bool visible = false;
  std::size_t content_hash = 0;
  DynamicTextSource dynamic_source{};
};

// Owns the speech-bubble overlay: sizes it from its content, keeps it above an anchor
// point clamped into the monitor under that anchor, and runs the auto-hide and
// dynamic-refresh timers.
class BubblePositioner {
 public:
  BubblePositioner(Scheduler& scheduler,
                   const ScreenGeometryProvider& screens,
                   const TextMeasurer& measurer,
                   EventLog& log,
                   BubbleConfig config = {});
  ~BubblePositioner();

  BubblePositioner(const BubblePositioner&) = delete;
  BubblePositioner& operator=(const BubblePositioner&) = delete;

  // Replaces any bubble on screen. duration_ms == 0 keeps it until Close().
  void Show(const BubbleContent& content,
            const Point& anchor,
            int duration_ms,
            DynamicTextSource dynamic_source = {},
            int refresh_interval_ms = 1000);
  void UpdateAnchor(const Point& anchor);
  void Close();
  // Hides without notifying closed listeners (used when the whole pet is hidden).
  void Hide();

  void AddClosedListener(std::function<void()> listener);

  // The tracked window is not owned; it must outlive the positioner or be reset.
  void Track(const PetWindow* window) { tracked_window_ = window; }
  void FollowTrackedWindow();
  [[nodiscard]] Point tracked_anchor() const;
  void Announce(const std::string& title,
                const std::string& message,
                int duration_ms,
                std::vector<BubbleButton> buttons = {},
                DynamicTextSource dynamic_source = {},
                int refresh_interval_ms = 1000);

  [[nodiscard]] BubbleLayout ComputeLayout(const BubbleContent& content,
                                           const std::string& dynamic_text,
                                           bool has_dynamic) const;
  [[nodiscard]] static Rect ComputePlacement(const Point& anchor, const Size& size, int gap_y, const Rect& available);

  [[nodiscard]] const BubbleModel& model() const { return model_; }
  [[nodiscard]] bool visible() const { return model_.visible; }
  [[nodiscard]] const BubbleContent& content() const { return content_; }
  [[nodiscard]] const std::string& dynamic_text() const { return dynamic_text_; }
  [[nodiscard]] bool has_dynamic_line() const { return static_cast<bool>(model_.dynamic_source); }
  [[nodiscard]] const BubbleLayout& layout() const { return layout_; }
  [[nodiscard]] const Rect& frame() const { return frame_; }
  [[nodiscard]] const BubbleConfig& config() const { return config_; }
  [[nodiscard]] TimerId hide_timer() const { return hide_timer_; }
  [[nodiscard]] TimerId refresh_timer() const { return refresh_timer_; }
  [[nodiscard]] std::size_t shown_count() const { return shown_count_; }
  [[nodiscard]] std::size_t failed_poll_count() const { return failed_poll_count_; }

 private:
  void relayout();
  void place();
  void poll_dynamic_source();
  void stop_timers();
  [[nodiscard]] std::size_t hash_content() const;

  Scheduler& scheduler_;
  const ScreenGeometryProvider& screens_;
  const TextMeasurer& measurer_;
  EventLog& log_;
  BubbleConfig config_{};
  const PetWindow* tracked_window_ = nullptr;

  BubbleModel model_{};
  BubbleContent content_{};
  std::string dynamic_text_{};
  BubbleLayout layout_{};
  Rect frame_{};
  TimerId hide_timer_ = kInvalidTimerId;
  TimerId refresh_timer_ = kInvalidTimerId;
  std::vector<std::function<void()>> closed_listeners_{};
  std::size_t shown_count_ = 0;
  std::size_t failed_poll_count_ = 0;
};

Point anchor_point_for(const Rect& pet_frame, AnchorMode mode);

}  // namespace pawpal::core

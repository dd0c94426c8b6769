#include "pawpal/core/bubble_positioner.hpp"

#include <algorithm>
#include <functional>
#include <string>
#include <utility>

namespace pawpal::core {

Point anchor_point_for(const Rect& pet_frame, AnchorMode mode) {
  if (mode == AnchorMode::kCenter) {
    return pet_frame.center();
  }
  return {pet_frame.x + pet_frame.width / 2, pet_frame.y};
}

BubblePositioner::BubblePositioner(Scheduler& scheduler,
                                   const ScreenGeometryProvider& screens,
                                   const TextMeasurer& measurer,
                                   EventLog& log,
                                   BubbleConfig config)
    : scheduler_(scheduler), screens_(screens), measurer_(measurer), log_(log), config_(config) {}

BubblePositioner::~BubblePositioner() { stop_timers(); }

BubbleLayout BubblePositioner::ComputeLayout(const BubbleContent& content,
                                             const std::string& dynamic_text,
                                             bool has_dynamic) const {
  BubbleLayout layout{};
  const int max_content_w = std::max(1, config_.max_width - config_.pad_x * 2);
  const int min_content_w = std::max(1, config_.min_width - config_.pad_x * 2);

  // Natural widths at the widest allowed layout decide the final content width.
  const Size title_natural = measurer_.MeasureText(content.title, TextRole::kTitle, max_content_w);
  const Size message_natural = measurer_.MeasureText(content.message, TextRole::kMessage, max_content_w);
  int width = std::max({title_natural.width, message_natural.width, min_content_w});
  width = std::min(width, max_content_w);
  layout.content_width = width;

  layout.title = measurer_.MeasureText(content.title, TextRole::kTitle, width);
  layout.message = measurer_.MeasureText(content.message, TextRole::kMessage, width);
  int content_h = layout.title.height + layout.message.height;
  if (!content.title.empty() && !content.message.empty()) {
    content_h += config_.spacing;
  }
  if (has_dynamic) {
    layout.dynamic = measurer_.MeasureText(dynamic_text, TextRole::kDynamic, width);
    content_h += config_.spacing + layout.dynamic.height;
  }
  // The close action is always present once the row is shown.
  if (!content.buttons.empty()) {
    std::vector<std::string> labels;
    labels.reserve(content.buttons.size() + 1);
    for (const BubbleButton& button : content.buttons) {
      labels.push_back(button.label);
    }
    labels.emplace_back("x");
    layout.buttons = measurer_.MeasureButtonRow(labels);
    content_h += config_.button_row_margin + layout.buttons.height;
  }

  layout.total.width = width + config_.pad_x * 2;
  layout.total.height = content_h + config_.pad_y * 2 + config_.tail_height;
  return layout;
}

Rect BubblePositioner::ComputePlacement(const Point& anchor, const Size& size, int gap_y, const Rect& available) {
  Rect rect{};
  rect.width = size.width;
  rect.height = size.height;
  rect.x = clamp_span(anchor.x - size.width / 2, size.width, available.left(), available.right());
  rect.y = clamp_span(anchor.y - size.height - gap_y, size.height, available.top(), available.bottom());
  return rect;
}

void BubblePositioner::Show(const BubbleContent& content,
                            const Point& anchor,
                            int duration_ms,
                            DynamicTextSource dynamic_source,
                            int refresh_interval_ms) {
  scheduler_.CancelAndReset(refresh_timer_);
  model_.anchor = anchor;
  content_ = content;
  model_.dynamic_source = std::move(dynamic_source);
  dynamic_text_.clear();

  if (model_.dynamic_source) {
    const auto first = model_.dynamic_source();
    if (first.has_value()) {
      dynamic_text_ = *first;
    } else {
      ++failed_poll_count_;
    }
    const int interval = std::max(config_.min_refresh_ms, refresh_interval_ms);
    refresh_timer_ = scheduler_.ScheduleEvery(interval, [this]() { poll_dynamic_source(); });
  }

  relayout();
  model_.visible = true;
  ++shown_count_;

  scheduler_.CancelAndReset(hide_timer_);
  if (duration_ms > 0) {
    hide_timer_ = scheduler_.ScheduleOnce(duration_ms, [this]() {
      hide_timer_ = kInvalidTimerId;
      Close();
    });
  }
}

void BubblePositioner::UpdateAnchor(const Point& anchor) {
  model_.anchor = anchor;
  if (model_.visible) {
    place();
  }
}

void BubblePositioner::FollowTrackedWindow() {
  if (tracked_window_ == nullptr) {
    return;
  }
  UpdateAnchor(tracked_anchor());
}

Point BubblePositioner::tracked_anchor() const {
  if (tracked_window_ == nullptr) {
    return model_.anchor;
  }
  return anchor_point_for(tracked_window_->frame(), config_.anchor_mode);
}

void BubblePositioner::Announce(const std::string& title,
                                const std::string& message,
                                int duration_ms,
                                std::vector<BubbleButton> buttons,
                                DynamicTextSource dynamic_source,
                                int refresh_interval_ms) {
  BubbleContent content{};
  content.title = title;
  content.message = message;
  content.buttons = std::move(buttons);
  log_.Push("bubble", title + " | " + message);
  Show(content, tracked_anchor(), duration_ms, std::move(dynamic_source), refresh_interval_ms);
}

void BubblePositioner::Close() {
  stop_timers();
  model_.dynamic_source = nullptr;
  if (!model_.visible) {
    return;
  }
  model_.visible = false;
  for (const auto& listener : closed_listeners_) {
    listener();
  }
}

void BubblePositioner::Hide() {
  stop_timers();
  model_.dynamic_source = nullptr;
  model_.visible = false;
}

void BubblePositioner::AddClosedListener(std::function<void()> listener) {
  if (listener) {
    closed_listeners_.push_back(std::move(listener));
  }
}

void BubblePositioner::poll_dynamic_source() {
  if (!model_.dynamic_source) {
    scheduler_.CancelAndReset(refresh_timer_);
    return;
  }
  const auto text = model_.dynamic_source();
  if (!text.has_value()) {
    // Keep the last good line and keep polling.
    ++failed_poll_count_;
    return;
  }
  dynamic_text_ = *text;
  relayout();
}

void BubblePositioner::relayout() {
  layout_ = ComputeLayout(content_, dynamic_text_, static_cast<bool>(model_.dynamic_source));
  model_.content_hash = hash_content();
  place();
}

void BubblePositioner::place() {
  const Rect available = screens_.AvailableRectAt(model_.anchor);
  frame_ = ComputePlacement(model_.anchor, layout_.total, config_.gap_y, available);
}

void BubblePositioner::stop_timers() {
  scheduler_.CancelAndReset(hide_timer_);
  scheduler_.CancelAndReset(refresh_timer_);
}

std::size_t BubblePositioner::hash_content() const {
  std::string key = content_.title;
  key += '\x1f';
  key += content_.message;
  key += '\x1f';
  key += dynamic_text_;
  for (const BubbleButton& button : content_.buttons) {
    key += '\x1f';
    key += button.label;
  }
  return std::hash<std::string>{}(key);
}

}  // namespace pawpal::core

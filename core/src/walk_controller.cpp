#include "pawpal/core/walk_controller.hpp"

#include <cmath>
#include <string>

#include "pawpal/core/window_placement.hpp"

namespace pawpal::core {

namespace {

constexpr double kPi = 3.14159265358979323846;

}  // namespace

WalkController::WalkController(Scheduler& scheduler,
                               PetWindow& window,
                               const ScreenGeometryProvider& screens,
                               BubblePositioner& bubble,
                               const ActivityFlags& flags,
                               EventLog& log,
                               WalkConfig config)
    : scheduler_(scheduler),
      window_(window),
      screens_(screens),
      bubble_(bubble),
      flags_(flags),
      log_(log),
      config_(config) {}

WalkController::~WalkController() { scheduler_.CancelAndReset(tick_timer_); }

void WalkController::Start(int direction) {
  const int dir = direction < 0 ? -1 : +1;
  if (walking()) {
    direction_ = dir;
    return;
  }

  direction_ = dir;
  step_accumulator_ = 0.0;
  baseline_y_ = window_.position().y;
  started_ms_ = scheduler_.now_ms();
  if (tick_timer_ == kInvalidTimerId) {
    tick_timer_ = scheduler_.ScheduleEvery(config_.tick_ms, [this]() { (void)Tick(); });
  }
  log_.Push("walk", std::string("start dir=") + (dir < 0 ? "-1" : "+1"));
}

void WalkController::Stop() {
  const bool was_walking = walking();
  direction_ = 0;
  step_accumulator_ = 0.0;
  scheduler_.CancelAndReset(tick_timer_);
  if (baseline_y_.has_value()) {
    window_.Move({window_.position().x, *baseline_y_});
  }
  baseline_y_.reset();
  bubble_.FollowTrackedWindow();
  if (was_walking) {
    log_.Push("walk", "stop");
  }
}

int WalkController::bob_offset(std::int64_t elapsed_ms) const {
  if (config_.bob_px <= 0 || config_.bob_period_ms <= 0) {
    return 0;
  }
  const std::int64_t period = config_.bob_period_ms;
  const double phase = (2.0 * kPi) * static_cast<double>(elapsed_ms % period) / static_cast<double>(period);
  return static_cast<int>(std::lround(std::sin(phase) * config_.bob_px));
}

WalkTickResult WalkController::Tick() {
  WalkTickResult result{};
  result.position = window_.position();
  // Drag owns the window while it lasts.
  if (direction_ == 0 || flags_.dragging) {
    return result;
  }

  step_accumulator_ += config_.speed_px_per_sec * (static_cast<double>(config_.tick_ms) / 1000.0);
  const int step = static_cast<int>(step_accumulator_);
  step_accumulator_ -= step;
  const int dx = step * direction_;

  const Size size = window_.size();
  // The window may have crossed onto another monitor since the last tick.
  const Rect available = available_rect_for(window_, screens_);
  const int min_x = available.left();
  const int max_x = available.right() - size.width;

  int new_x = result.position.x + dx;
  int new_y = result.position.y;
  if (baseline_y_.has_value()) {
    new_y = *baseline_y_ + bob_offset(scheduler_.now_ms() - started_ms_);
  }
  new_y = clamp_span(new_y, size.height, available.top(), available.bottom());

  bool hit_edge = false;
  if (new_x <= min_x) {
    new_x = min_x;
    hit_edge = dx < 0;
  } else if (new_x >= max_x) {
    new_x = max_x;
    hit_edge = dx > 0;
  }

  const Point next{new_x, new_y};
  if (next != result.position) {
    window_.Move(next);
    result.moved = true;
  }
  bubble_.FollowTrackedWindow();

  result.dx = dx;
  result.position = next;
  result.hit_edge = hit_edge;
  if (hit_edge) {
    log_.Push("walk", "edge at x=" + std::to_string(new_x));
    if (edge_handler_) {
      edge_handler_();
    }
  }
  return result;
}

}  // namespace pawpal::core

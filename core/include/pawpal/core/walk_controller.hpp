#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "pawpal/core/bubble_positioner.hpp"
#include "pawpal/core/config.hpp"
#include "pawpal/core/entities.hpp"
#include "pawpal/core/event_log.hpp"
#include "pawpal/core/id.hpp"
#include "pawpal/core/scheduler.hpp"
#include "pawpal/core/services.hpp"

namespace pawpal::core {

struct WalkTickResult {
  bool moved = false;
  int dx = 0;
  Point position{};
  bool hit_edge = false;
};

// Horizontal walking kinematics with a fractional step accumulator and an optional
// vertical bob around the Y the walk started from.
class WalkController {
 public:
  using EdgeHandler = std::function<void()>;

  WalkController(Scheduler& scheduler,
                 PetWindow& window,
                 const ScreenGeometryProvider& screens,
                 BubblePositioner& bubble,
                 const ActivityFlags& flags,
                 EventLog& log,
                 WalkConfig config = {});
  ~WalkController();

  WalkController(const WalkController&) = delete;
  WalkController& operator=(const WalkController&) = delete;

  // Starting while already walking only changes direction; baseline and bob phase are
  // kept so reversals never accumulate a bob offset.
  void Start(int direction);
  // Restores the baseline Y exactly and clears it.
  void Stop();
  WalkTickResult Tick();

  // Invoked after the window reached the boundary it was heading for.
  void SetEdgeHandler(EdgeHandler handler) { edge_handler_ = std::move(handler); }

  [[nodiscard]] bool walking() const { return direction_ != 0; }
  [[nodiscard]] int direction() const { return direction_; }
  [[nodiscard]] std::optional<int> baseline_y() const { return baseline_y_; }
  [[nodiscard]] double accumulator() const { return step_accumulator_; }
  [[nodiscard]] TimerId tick_timer() const { return tick_timer_; }
  [[nodiscard]] const WalkConfig& config() const { return config_; }

 private:
  [[nodiscard]] int bob_offset(std::int64_t elapsed_ms) const;

  Scheduler& scheduler_;
  PetWindow& window_;
  const ScreenGeometryProvider& screens_;
  BubblePositioner& bubble_;
  const ActivityFlags& flags_;
  EventLog& log_;
  WalkConfig config_{};
  EdgeHandler edge_handler_{};

  int direction_ = 0;
  double step_accumulator_ = 0.0;
  std::optional<int> baseline_y_{};
  std::int64_t started_ms_ = 0;
  TimerId tick_timer_ = kInvalidTimerId;
};

}  // namespace pawpal::core

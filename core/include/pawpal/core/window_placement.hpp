#pragma once

#include "pawpal/core/services.hpp"
#include "pawpal/core/types.hpp"

namespace pawpal::core {

// Top-left that keeps a window of the given size fully inside available.
Point clamp_into(const Point& top_left, const Size& size, const Rect& available);

// Snaps each axis independently to an edge of available that lies within margin.
Point snap_to_edges(const Point& top_left, const Size& size, const Rect& available, int margin);

// Monitor under the window's center.
Rect available_rect_for(const PetWindow& window, const ScreenGeometryProvider& screens);

// Moves the window fully on screen. Returns true when it had to move.
bool EnsureOnScreen(PetWindow& window, const ScreenGeometryProvider& screens);

}  // namespace pawpal::core

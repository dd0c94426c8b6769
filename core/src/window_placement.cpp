#include "pawpal/core/window_placement.hpp"

#include <cstdlib>

namespace pawpal::core {

Point clamp_into(const Point& top_left, const Size& size, const Rect& available) {
  return {clamp_span(top_left.x, size.width, available.left(), available.right()),
          clamp_span(top_left.y, size.height, available.top(), available.bottom())};
}

Point snap_to_edges(const Point& top_left, const Size& size, const Rect& available, int margin) {
  Point snapped = top_left;
  if (std::abs(snapped.x - available.left()) <= margin) {
    snapped.x = available.left();
  }
  if (std::abs((snapped.x + size.width) - available.right()) <= margin) {
    snapped.x = available.right() - size.width;
  }
  if (std::abs(snapped.y - available.top()) <= margin) {
    snapped.y = available.top();
  }
  if (std::abs((snapped.y + size.height) - available.bottom()) <= margin) {
    snapped.y = available.bottom() - size.height;
  }
  return clamp_into(snapped, size, available);
}

Rect available_rect_for(const PetWindow& window, const ScreenGeometryProvider& screens) {
  return screens.AvailableRectAt(window.frame().center());
}

bool EnsureOnScreen(PetWindow& window, const ScreenGeometryProvider& screens) {
  const Point current = window.position();
  const Point clamped = clamp_into(current, window.size(), available_rect_for(window, screens));
  if (clamped == current) {
    return false;
  }
  window.Move(clamped);
  return true;
}

}  // namespace pawpal::core

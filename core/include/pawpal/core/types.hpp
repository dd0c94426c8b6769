#pragma once

#include <algorithm>

namespace pawpal::core {

struct Point {
  int x = 0;
  int y = 0;

  bool operator==(const Point& other) const { return x == other.x && y == other.y; }
  bool operator!=(const Point& other) const { return !(*this == other); }
};

inline Point operator+(const Point& a, const Point& b) {
  return {a.x + b.x, a.y + b.y};
}

inline Point operator-(const Point& a, const Point& b) {
  return {a.x - b.x, a.y - b.y};
}

inline int manhattan_length(const Point& p) {
  return (p.x < 0 ? -p.x : p.x) + (p.y < 0 ? -p.y : p.y);
}

struct Size {
  int width = 0;
  int height = 0;

  [[nodiscard]] bool empty() const { return width <= 0 || height <= 0; }
  bool operator==(const Size& other) const { return width == other.width && height == other.height; }
  bool operator!=(const Size& other) const { return !(*this == other); }
};

// Right/bottom are exclusive: a window of width w at x = right() - w touches the edge.
struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  [[nodiscard]] int left() const { return x; }
  [[nodiscard]] int top() const { return y; }
  [[nodiscard]] int right() const { return x + width; }
  [[nodiscard]] int bottom() const { return y + height; }
  [[nodiscard]] Point top_left() const { return {x, y}; }
  [[nodiscard]] Point center() const { return {x + width / 2, y + height / 2}; }
  [[nodiscard]] Size size() const { return {width, height}; }

  [[nodiscard]] bool contains(const Point& p) const {
    return p.x >= x && p.x < right() && p.y >= y && p.y < bottom();
  }

  [[nodiscard]] bool contains(const Rect& r) const {
    return r.x >= x && r.y >= y && r.right() <= right() && r.bottom() <= bottom();
  }

  bool operator==(const Rect& other) const {
    return x == other.x && y == other.y && width == other.width && height == other.height;
  }
};

inline Rect make_rect(const Point& top_left, const Size& size) {
  return {top_left.x, top_left.y, size.width, size.height};
}

inline Rect united(const Rect& a, const Rect& b) {
  if (a.width <= 0 || a.height <= 0) {
    return b;
  }
  if (b.width <= 0 || b.height <= 0) {
    return a;
  }
  const int left = std::min(a.left(), b.left());
  const int top = std::min(a.top(), b.top());
  const int right = std::max(a.right(), b.right());
  const int bottom = std::max(a.bottom(), b.bottom());
  return {left, top, right - left, bottom - top};
}

// Clamps one axis so that [value, value + extent) stays inside [lo, hi). Prefers lo when
// the extent does not fit.
inline int clamp_span(int value, int extent, int lo, int hi) {
  return std::max(lo, std::min(value, hi - extent));
}

}  // namespace pawpal::core

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pawpal/core/entities.hpp"
#include "pawpal/core/types.hpp"

namespace pawpal::core {

// Multi-monitor geometry. Returns the usable rectangle of the monitor containing the
// point, or of the primary monitor when no monitor contains it.
class ScreenGeometryProvider {
 public:
  virtual ~ScreenGeometryProvider() = default;

  [[nodiscard]] virtual Rect AvailableRectAt(const Point& point) const = 0;
};

// The pet's top-level window. Owns the window position.
class PetWindow {
 public:
  virtual ~PetWindow() = default;

  [[nodiscard]] virtual Point position() const = 0;
  [[nodiscard]] virtual Size size() const = 0;
  [[nodiscard]] virtual bool visible() const = 0;
  virtual void Move(const Point& top_left) = 0;
  virtual void Resize(const Size& size) = 0;
  virtual void SetVisible(bool visible) = 0;

  [[nodiscard]] Rect frame() const { return make_rect(position(), size()); }
};

class AnimationSurface {
 public:
  virtual ~AnimationSurface() = default;

  virtual void Start() = 0;
  virtual void Stop() = 0;
  [[nodiscard]] virtual bool playing() const = 0;
  [[nodiscard]] virtual Size current_frame_size() const = 0;
  virtual void SetPlaybackSpeedPercent(int percent) = 0;
  virtual void SetRenderedSize(const Size& size) = 0;
};

class AnimationLoader {
 public:
  virtual ~AnimationLoader() = default;

  // Fails with a "missing asset" error when nothing exists at the path.
  virtual OpResult<std::unique_ptr<AnimationSurface>> Load(const std::string& path) = 0;
};

enum class TextRole : std::uint8_t {
  kTitle = 0,
  kMessage = 1,
  kDynamic = 2,
};

class TextMeasurer {
 public:
  virtual ~TextMeasurer() = default;

  // Size of the text laid out with word wrap at wrap_width.
  [[nodiscard]] virtual Size MeasureText(std::string_view text, TextRole role, int wrap_width) const = 0;
  [[nodiscard]] virtual Size MeasureButtonRow(const std::vector<std::string>& labels) const = 0;
};

class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Uniform in [0, 1).
  virtual double NextUnit() = 0;
  // Uniform in [lo, hi], both inclusive.
  virtual int NextInt(int lo, int hi) = 0;
};

}  // namespace pawpal::core

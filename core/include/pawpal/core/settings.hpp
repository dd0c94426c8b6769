#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "pawpal/core/entities.hpp"

namespace pawpal::core {

bool parse_bool(std::string_view value, bool fallback);
int parse_int(std::string_view value, int fallback);
double parse_double(std::string_view value, double fallback);

// Key-value settings. Typed getters coerce: a stored value that does not parse as the
// requested type yields the caller's default, never an error.
class SettingsStore {
 public:
  virtual ~SettingsStore() = default;

  [[nodiscard]] virtual std::optional<std::string> Find(std::string_view key) const = 0;
  virtual void Set(std::string_view key, std::string value) = 0;
  virtual OpResult<bool> Flush() = 0;

  [[nodiscard]] bool GetBool(std::string_view key, bool fallback) const;
  [[nodiscard]] int GetInt(std::string_view key, int fallback) const;
  [[nodiscard]] double GetDouble(std::string_view key, double fallback) const;
  void SetBool(std::string_view key, bool value);
  void SetInt(std::string_view key, int value);
  void SetDouble(std::string_view key, double value);
};

// Plain "key=value" file, one entry per line. Unknown and malformed lines are kept
// out of the parsed map.
class IniSettingsStore final : public SettingsStore {
 public:
  explicit IniSettingsStore(std::string path) : path_(std::move(path)) {}

  // A missing file is not an error: the store starts empty and every getter returns
  // its default.
  OpResult<bool> Load();

  [[nodiscard]] std::optional<std::string> Find(std::string_view key) const override;
  void Set(std::string_view key, std::string value) override;
  OpResult<bool> Flush() override;

  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] bool dirty() const { return dirty_; }

 private:
  std::string path_;
  std::map<std::string, std::string, std::less<>> values_{};
  bool dirty_ = false;
};

namespace settings_keys {
constexpr std::string_view kLocked = "locked";
constexpr std::string_view kChatterEnabled = "chatter_enabled";
constexpr std::string_view kRestEnabled = "rest_enabled";
constexpr std::string_view kRestIntervalMinutes = "rest_interval_minutes";
constexpr std::string_view kScale = "scale";
constexpr std::string_view kAutoRoundtripEnabled = "auto_roundtrip_enabled";
constexpr std::string_view kPosX = "pos_x";
constexpr std::string_view kPosY = "pos_y";
}  // namespace settings_keys

}  // namespace pawpal::core

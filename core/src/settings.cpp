#include "pawpal/core/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace pawpal::core {

namespace {

std::string trimmed(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}

std::string lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

bool parse_bool(std::string_view value, bool fallback) {
  const std::string v = lowered(trimmed(value));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    return false;
  }
  return fallback;
}

int parse_int(std::string_view value, int fallback) {
  const std::string v = trimmed(value);
  if (v.empty()) {
    return fallback;
  }
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(v, &consumed);
    return consumed == v.size() ? parsed : fallback;
  } catch (const std::logic_error&) {
    // invalid_argument or out_of_range: keep the default.
    return fallback;
  }
}

double parse_double(std::string_view value, double fallback) {
  const std::string v = trimmed(value);
  if (v.empty()) {
    return fallback;
  }
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(v, &consumed);
    return consumed == v.size() && std::isfinite(parsed) ? parsed : fallback;
  } catch (const std::logic_error&) {
    return fallback;
  }
}

bool SettingsStore::GetBool(std::string_view key, bool fallback) const {
  const auto value = Find(key);
  return value.has_value() ? parse_bool(*value, fallback) : fallback;
}

int SettingsStore::GetInt(std::string_view key, int fallback) const {
  const auto value = Find(key);
  return value.has_value() ? parse_int(*value, fallback) : fallback;
}

double SettingsStore::GetDouble(std::string_view key, double fallback) const {
  const auto value = Find(key);
  return value.has_value() ? parse_double(*value, fallback) : fallback;
}

void SettingsStore::SetBool(std::string_view key, bool value) {
  Set(key, value ? "true" : "false");
}

void SettingsStore::SetInt(std::string_view key, int value) {
  Set(key, std::to_string(value));
}

void SettingsStore::SetDouble(std::string_view key, double value) {
  std::ostringstream oss;
  oss << value;
  Set(key, oss.str());
}

OpResult<bool> IniSettingsStore::Load() {
  OpResult<bool> result;
  values_.clear();
  dirty_ = false;

  std::ifstream ifs(path_);
  if (!ifs.is_open()) {
    result.ok = true;
    result.value = false;
    return result;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty() || line[0] == '#' || line[0] == ';') {
      continue;
    }
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    const std::string key = trimmed(std::string_view(line).substr(0, eq));
    if (key.empty()) {
      continue;
    }
    values_[key] = trimmed(std::string_view(line).substr(eq + 1));
  }

  result.ok = true;
  result.value = true;
  return result;
}

std::optional<std::string> IniSettingsStore::Find(std::string_view key) const {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void IniSettingsStore::Set(std::string_view key, std::string value) {
  auto it = values_.find(key);
  if (it != values_.end()) {
    if (it->second == value) {
      return;
    }
    it->second = std::move(value);
  } else {
    values_.emplace(std::string(key), std::move(value));
  }
  dirty_ = true;
}

OpResult<bool> IniSettingsStore::Flush() {
  OpResult<bool> result;
  if (!dirty_) {
    result.ok = true;
    return result;
  }

  std::ofstream ofs(path_, std::ios::trunc);
  if (!ofs.is_open()) {
    result.error = "cannot open settings file for writing: " + path_;
    return result;
  }
  for (const auto& [key, value] : values_) {
    ofs << key << "=" << value << "\n";
  }
  if (!ofs.good()) {
    result.error = "failed to write settings file: " + path_;
    return result;
  }

  dirty_ = false;
  result.ok = true;
  result.value = true;
  return result;
}

}  // namespace pawpal::core

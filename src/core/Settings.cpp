/* @file Settings.cpp
 * @brief JSON → Settings with schema checks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Autopilot headers
#include "core/Errors.hpp"
#include "core/Settings.hpp"

using namespace autopilot::core;
using nlohmann::json;

namespace {

  template <typename T> void readKey(const json& j, const char* key, T& out) {
    if (!j.contains(key))
      return;
    try {
      out = j.at(key).get<T>();
    } catch (const json::exception& e) {
      throw ConfigurationError(std::string("[Settings] bad value for '") + key + "': " + e.what());
    }
  }

  void readMillis(const json& j, const char* key, std::chrono::milliseconds& out,
                  bool allowZero = false) {
    long long ms = out.count();
    readKey(j, key, ms);
    if (ms < 0 || (!allowZero && ms == 0))
      throw ConfigurationError(std::string("[Settings] '") + key + "' must be positive");
    out = std::chrono::milliseconds{ ms };
  }

} // namespace

Settings Settings::fromJson(const json& j) {
  if (!j.is_object())
    throw ConfigurationError("[Settings] config root must be a JSON object");

  Settings s;
  readKey(j, "steps_file", s.stepsFile);
  readKey(j, "project_name", s.projectName);
  readKey(j, "log_dir", s.logDir);

  readMillis(j, "poll_interval_ms", s.pollInterval);
  readMillis(j, "step_check_interval_ms", s.stepCheckInterval);
  readMillis(j, "action_delay_ms", s.timing.actionDelay, true);
  readMillis(j, "key_hold_ms", s.timing.keyHold, true);
  readMillis(j, "typing_pause_ms", s.timing.typingPause, true);

  readKey(j, "continue_message", s.messages.continueImplementation);
  readKey(j, "next_step_message", s.messages.nextStep);

  readKey(j, "ocr_scale", s.ocrScale);
  if (s.ocrScale < 1)
    throw ConfigurationError("[Settings] 'ocr_scale' must be >= 1");
  readKey(j, "ocr_language", s.ocrLanguage);
  readKey(j, "tessdata_dir", s.tessdataDir);

  readKey(j, "min_region_width", s.minRegionWidth);
  readKey(j, "min_region_height", s.minRegionHeight);

  if (j.contains("region")) {
    const auto& r = j.at("region");
    if (!r.is_object())
      throw ConfigurationError("[Settings] 'region' must be an object");
    io::Region region;
    readKey(r, "left", region.left);
    readKey(r, "top", region.top);
    readKey(r, "right", region.right);
    readKey(r, "bottom", region.bottom);
    region = io::Region::fromCorners(region.left, region.top, region.right, region.bottom);
    validateRegion(region, s.minRegionWidth, s.minRegionHeight);
    s.region = region;
  }

  readKey(j, "status_panel", s.statusPanel);

  if (s.stepsFile.empty())
    throw ConfigurationError("[Settings] 'steps_file' must not be empty");
  return s;
}

std::string Settings::effectiveProjectName() const {
  if (!projectName.empty())
    return projectName;
  return std::filesystem::path(stepsFile).stem().string();
}

void autopilot::core::validateRegion(const io::Region& r, int minWidth, int minHeight) {
  if (r.width() <= 0 || r.height() <= 0)
    throw ConfigurationError("[Settings] selected region is empty");
  if (r.width() < minWidth || r.height() < minHeight)
    throw ConfigurationError("[Settings] selected region " + std::to_string(r.width()) + "x" +
                             std::to_string(r.height()) + " is smaller than " +
                             std::to_string(minWidth) + "x" + std::to_string(minHeight));
}

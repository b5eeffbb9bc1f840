#pragma once
/** @file  Settings.hpp
 *  @brief Typed, validated view of the JSON configuration.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/ActionEmitter.hpp" // EmitterTiming / EmitterMessages
#include "io/ScreenCapture.hpp"   // Region

namespace autopilot {
  namespace core {

    struct Settings {
      std::string stepsFile{ "project_steps.md" };
      std::string projectName{}; ///< defaults to the steps file stem
      std::string logDir{ "logs" };

      std::chrono::milliseconds pollInterval{ 500 };
      std::chrono::milliseconds stepCheckInterval{ 1000 };

      EmitterTiming timing{};
      EmitterMessages messages{};

      int ocrScale{ 3 };
      std::string ocrLanguage{ "eng" };
      std::string tessdataDir{}; ///< empty → Tesseract's built-in search path

      std::optional<io::Region> region{}; ///< nullopt → interactive selection
      int minRegionWidth{ 10 };
      int minRegionHeight{ 5 };

      bool statusPanel{ true };

      /// Overlay the keys present in \p j onto the defaults; throws `ConfigurationError`.
      static Settings fromJson(const nlohmann::json& j);

      /// Project name, falling back to the steps file stem.
      std::string effectiveProjectName() const;
    };

    /// Throws `ConfigurationError` if \p r is empty or below the minimum size.
    void validateRegion(const io::Region& r, int minWidth, int minHeight);

  } // namespace core
} // namespace autopilot

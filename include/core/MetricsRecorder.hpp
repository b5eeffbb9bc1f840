#pragma once
/** @file  MetricsRecorder.hpp
 *  @brief Per-step timing + counters, persisted write-through as JSON.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/ErrorMonitor.hpp"
#include "core/StepIndex.hpp" // StepStatus + glyphs

namespace autopilot {
  namespace core {

    struct StepMetric {
      std::string name;
      std::chrono::system_clock::time_point startTime{};
      std::optional<std::chrono::system_clock::time_point> endTime{};
      StepStatus status{ StepStatus::InProgress };
      std::optional<double> durationSeconds{};
      std::uint32_t commandsAtEnd{ 0 };
      std::uint32_t messagesAtEnd{ 0 };
    };

    /**
 * @class MetricsRecorder
 * @brief Tracks at most one open step; every transition rewrites the metrics file.
 *
 *  * Thread-safe: operator commands and the poll loop both call in.
 *  * Steps keep first-start order; restarting a name overwrites its entry.
 *  * Write failures go to the ErrorMonitor, never to the caller.
 */
    class MetricsRecorder {
    public:
      using Clock = std::function<std::chrono::system_clock::time_point()>;

      MetricsRecorder(std::string projectName, std::string metricsPath,
                      std::shared_ptr<ErrorMonitor> errMonitor, Clock clock = {});

      /// `<logDir>/project_metrics_YYYYmmdd_HHMMSS.json` for \p now.
      static std::string defaultPath(const std::string& logDir,
                                     std::chrono::system_clock::time_point now);

      void startStep(const std::string& name);            ///< closes an open step as ✓ first
      void endStep(StepStatus status = StepStatus::Complete); ///< no-op without an open step
      void updateCounts(std::uint32_t commands, std::uint32_t messages);

      /// Sum of recorded durations; the open step does not count.
      double totalDuration() const;

      std::string report() const;

      std::optional<std::string> currentStep() const;
      std::vector<StepMetric> steps() const;
      const std::string& metricsPath() const { return path_; }

      nlohmann::json toJson() const;

    private:
      void endLocked(StepStatus status);
      double totalLocked() const;
      nlohmann::json toJsonLocked() const;
      void saveLocked() const;

      std::string project_;
      std::string path_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      Clock clock_;

      mutable std::mutex mtx_;
      std::vector<StepMetric> steps_;
      std::optional<std::size_t> open_{}; ///< index into steps_
      std::uint32_t commands_{ 0 };
      std::uint32_t messages_{ 0 };
    };

  } // namespace core
} // namespace autopilot

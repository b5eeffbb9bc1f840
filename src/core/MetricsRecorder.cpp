/* @file MetricsRecorder.cpp
 * @brief step metrics bookkeeping, JSON snapshot and boxed text report
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Autopilot headers
#include "core/MetricsRecorder.hpp"
#include "core/TextUtil.hpp"

using namespace autopilot::core;
using nlohmann::json;

namespace {

  constexpr std::size_t kInner = 54; ///< report box content width

  double toEpochSeconds(std::chrono::system_clock::time_point t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
  }

  std::string fixed1(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", v);
    return buf;
  }

  std::string boxLine(std::string_view content) { return "║ " + padRight(content, kInner) + " ║"; }

  std::string rule(const char* left, const char* right) {
    std::string out = left;
    for (std::size_t i = 0; i < kInner + 2; ++i)
      out += "═";
    return out + right;
  }

} // namespace

MetricsRecorder::MetricsRecorder(std::string projectName, std::string metricsPath,
                                 std::shared_ptr<ErrorMonitor> errMonitor, Clock clock)
    : project_(std::move(projectName)), path_(std::move(metricsPath)),
      errorMonitor_(std::move(errMonitor)), clock_(std::move(clock)) {
  assert(errorMonitor_ && "[MetricsRecorder] error monitor is nullptr");
  if (!clock_)
    clock_ = [] { return std::chrono::system_clock::now(); };
}

std::string MetricsRecorder::defaultPath(const std::string& logDir,
                                         std::chrono::system_clock::time_point now) {
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&secs, &tm);
  std::ostringstream name;
  name << "project_metrics_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".json";
  return (std::filesystem::path(logDir) / name.str()).string();
}

void MetricsRecorder::startStep(const std::string& name) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (open_)
    endLocked(StepStatus::Complete);

  StepMetric metric;
  metric.name = name;
  metric.startTime = clock_();

  auto it = std::find_if(steps_.begin(), steps_.end(),
                         [&](const StepMetric& m) { return m.name == name; });
  if (it != steps_.end()) {
    *it = std::move(metric);
    open_ = static_cast<std::size_t>(it - steps_.begin());
  } else {
    steps_.push_back(std::move(metric));
    open_ = steps_.size() - 1;
  }
  saveLocked();
}

void MetricsRecorder::endStep(StepStatus status) {
  std::lock_guard<std::mutex> lock(mtx_);
  endLocked(status);
}

void MetricsRecorder::endLocked(StepStatus status) {
  if (!open_)
    return;
  auto& step = steps_[*open_];
  step.endTime = clock_();
  step.status = status;
  step.durationSeconds = std::chrono::duration<double>(*step.endTime - step.startTime).count();
  step.commandsAtEnd = commands_;
  step.messagesAtEnd = messages_;
  open_.reset();
  saveLocked();
}

void MetricsRecorder::updateCounts(std::uint32_t commands, std::uint32_t messages) {
  std::lock_guard<std::mutex> lock(mtx_);
  commands_ = commands;
  messages_ = messages;
  if (!open_)
    return;
  steps_[*open_].commandsAtEnd = commands;
  steps_[*open_].messagesAtEnd = messages;
  saveLocked();
}

double MetricsRecorder::totalDuration() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return totalLocked();
}

double MetricsRecorder::totalLocked() const {
  double total = 0.0;
  for (const auto& step : steps_)
    if (step.durationSeconds)
      total += *step.durationSeconds;
  return total;
}

std::optional<std::string> MetricsRecorder::currentStep() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!open_)
    return std::nullopt;
  return steps_[*open_].name;
}

std::vector<StepMetric> MetricsRecorder::steps() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return steps_;
}

std::string MetricsRecorder::report() const {
  std::lock_guard<std::mutex> lock(mtx_);

  std::vector<std::string> lines;
  lines.push_back(rule("╔", "╗"));
  lines.push_back(boxLine("Project: " + project_));
  lines.push_back(rule("╠", "╣"));
  lines.push_back(boxLine("Step Metrics:"));
  for (const auto& step : steps_) {
    const std::string duration =
        step.durationSeconds ? fixed1(*step.durationSeconds) + "s" : "In Progress";
    lines.push_back(boxLine(std::string(toGlyph(step.status)) + " " + padRight(step.name, 30) +
                            " " + duration));
  }
  lines.push_back(rule("╠", "╣"));
  lines.push_back(boxLine("Total Duration: " + fixed1(totalLocked()) + " seconds"));
  lines.push_back(rule("╚", "╝"));

  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i)
      out += '\n';
    out += lines[i];
  }
  return out;
}

json MetricsRecorder::toJson() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return toJsonLocked();
}

json MetricsRecorder::toJsonLocked() const {
  json steps = json::object();
  for (const auto& step : steps_) {
    steps[step.name] = {
      { "step_name", step.name },
      { "start_time", toEpochSeconds(step.startTime) },
      { "end_time", step.endTime ? json(toEpochSeconds(*step.endTime)) : json(nullptr) },
      { "status", std::string(toGlyph(step.status)) },
      { "duration", step.durationSeconds ? json(*step.durationSeconds) : json(nullptr) },
      { "commands_executed", step.commandsAtEnd },
      { "messages_sent", step.messagesAtEnd },
    };
  }
  return { { "project_name", project_ }, { "total_duration", totalLocked() }, { "steps", steps } };
}

void MetricsRecorder::saveLocked() const {
  const std::filesystem::path target(path_);
  std::error_code ec;
  if (target.has_parent_path())
    std::filesystem::create_directories(target.parent_path(), ec);

  std::ofstream f(target);
  if (!f.is_open()) {
    errorMonitor_->notifyFailure("[MetricsRecorder] cannot write " + path_);
    return;
  }
  f << toJsonLocked().dump(2);
  if (!f)
    errorMonitor_->notifyFailure("[MetricsRecorder] write failed: " + path_);
}

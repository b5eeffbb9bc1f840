/* @file AutomationCoordinator.cpp
 * @brief poll loop, checklist refresh timer, operator commands and shutdown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <string_view>

// Autopilot headers
#include "core/AutomationCoordinator.hpp"
#include "core/AutomationStateMachine.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/MetricsRecorder.hpp"
#include "core/StepResolver.hpp"
#include "core/TextSampler.hpp"
#include "io/ConsoleChannel.hpp"

using namespace autopilot::core;

namespace {

  constexpr std::chrono::milliseconds kReaderPoll{ 200 };
  constexpr std::string_view kStepsReadError{ "Error parsing steps file" };

  const char* phaseName(int p) {
    static const char* names[] = { "BOOT", "READY", "RUNNING", "FINISHED" };
    return names[p];
  }

  const char* kHelp[] = {
    "step <name>    : Start tracking a step",
    "complete       : Mark current step complete",
    "fail           : Mark current step failed",
    "metrics        : Show step metrics",
    "pause          : Pause automation",
    "resume         : Resume automation",
    "next           : Ask for the next step",
    "log            : Show log location",
    "help           : Show this help",
    "stop/exit/quit : Stop automation",
  };

} // namespace

AutomationCoordinator::AutomationCoordinator(Settings settings, AutomationStateMachine& machine,
                                             TextSampler& sampler, StepResolver& resolver,
                                             MetricsRecorder& metrics, Logger& logger,
                                             std::shared_ptr<ErrorMonitor> errMonitor)
    : settings_(std::move(settings)), machine_(machine), sampler_(sampler), resolver_(resolver),
      metrics_(metrics), logger_(logger), errorMonitor_(std::move(errMonitor)) {
  assert(errorMonitor_ && "[AutomationCoordinator] error monitor is nullptr");
  errorMonitor_->registerEscalation([this](const std::string& msg) { logger_.error(msg); });
}

AutomationCoordinator::~AutomationCoordinator() {
  errorMonitor_->registerEscalation({});
  requestStop();
  if (reader_.joinable())
    reader_.join();
}

void AutomationCoordinator::transitionTo(Phase next) {
  logger_.info(std::string("[AutomationCoordinator] ") + phaseName(static_cast<int>(phase_)) +
               " -> " + phaseName(static_cast<int>(next)));
  phase_ = next;
}

void AutomationCoordinator::initialize() {
  if (phase_ != Phase::BOOT)
    return;

  if (resolver_.refresh(Clock::now()) == StepResolver::RefreshResult::ReadFailed)
    throw DocumentReadError(resolver_.lastError());

  {
    std::lock_guard<std::mutex> lock(statusMtx_);
    if (const auto& step = resolver_.current())
      stepPath_ = step->path;
  }
  if (const auto& step = resolver_.current())
    logger_.info("Current step: " + step->joined());

  registerCommands();
  machine_.start();
  running_ = true;
  transitionTo(Phase::READY);
  setLastAction("Starting automation... Type 'help' for commands");
}

void AutomationCoordinator::registerCommands() {
  commands_.registerCommand("step", [this](const std::string& name) {
    if (name.empty()) {
      say("usage: step <name>");
      return;
    }
    metrics_.startStep(name);
    logger_.info("Started step: " + name);
    setLastAction("Started step: " + name);
  });

  commands_.registerCommand("complete", [this](const std::string&) {
    metrics_.endStep(StepStatus::Complete);
    setLastAction("Completed current step");
  });

  commands_.registerCommand("fail", [this](const std::string&) {
    metrics_.endStep(StepStatus::Incomplete);
    setLastAction("Marked current step as failed");
  });

  commands_.registerCommand("metrics", [this](const std::string&) { say(metrics_.report()); });

  commands_.registerCommand("pause", [this](const std::string&) {
    if (machine_.pause())
      setLastAction("Automation paused");
  });

  commands_.registerCommand("resume", [this](const std::string&) {
    if (machine_.resume())
      setLastAction("Automation resumed");
  });

  commands_.registerCommand("next", [this](const std::string&) {
    if (machine_.emitManual(Action::NextStep)) {
      const auto s = machine_.snapshot();
      metrics_.updateCounts(s.commandsExecuted, s.messagesSent);
      setLastAction("Sent: Move to next step");
    }
  });

  commands_.registerCommand("log", [this](const std::string&) {
    say("Log file: " + logger_.currentFile());
    say("Metrics file: " + metrics_.metricsPath());
  });

  commands_.registerCommand("help", [this](const std::string&) {
    for (const char* line : kHelp)
      say(line);
  });

  commands_.registerAliases({ "stop", "exit", "quit" }, [this](const std::string&) {
    if (metrics_.currentStep())
      metrics_.endStep(StepStatus::Complete);
    logger_.info("Stopping automation...");
    setLastAction("Stopping automation...");
    requestStop();
  });
}

bool AutomationCoordinator::handleCommand(const std::string& line) {
  if (commands_.dispatch(line))
    return true;
  if (!line.empty())
    logger_.info("Ignoring unknown command: '" + line + "'");
  return false;
}

void AutomationCoordinator::requestStop() {
  {
    std::lock_guard<std::mutex> lock(wakeMtx_);
    running_ = false;
  }
  wake_.notify_all();
}

void AutomationCoordinator::run(io::ConsoleChannel* console) {
  if (phase_ == Phase::BOOT)
    initialize();
  transitionTo(Phase::RUNNING);

  console_ = console;
  if (console)
    reader_ = std::thread(&AutomationCoordinator::readerLoop, this, std::ref(*console));

  while (running_) {
    tick(Clock::now());

    std::unique_lock<std::mutex> lock(wakeMtx_);
    wake_.wait_for(lock, settings_.pollInterval, [this] { return !running_.load(); });
  }

  if (reader_.joinable())
    reader_.join();
  console_ = nullptr;

  machine_.stop();
  transitionTo(Phase::FINISHED);
}

void AutomationCoordinator::tick(Clock::time_point now) {
  refreshStep(now);
  // paused: skip capture + OCR entirely, not just the action
  if (machine_.isRunning())
    pollOnce();
}

void AutomationCoordinator::refreshStep(Clock::time_point now) {
  switch (resolver_.refresh(now)) {
  case StepResolver::RefreshResult::ReadFailed:
    errorMonitor_->notifyFailure(std::string(kStepsReadError) + ": " + resolver_.lastError());
    return;
  case StepResolver::RefreshResult::Unchanged:
    errorMonitor_->recover(kStepsReadError);
    return;
  case StepResolver::RefreshResult::Reparsed:
    errorMonitor_->recover(kStepsReadError);
    break;
  default:
    return;
  }

  std::optional<std::vector<std::string>> path;
  if (const auto& step = resolver_.current())
    path = step->path;

  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(statusMtx_);
    changed = path != stepPath_;
    stepPath_ = path;
  }
  if (changed) {
    if (const auto& step = resolver_.current())
      logger_.info("Current step: " + step->joined());
    publishStatus();
  }
}

void AutomationCoordinator::pollOnce() {
  const auto text = sampler_.sample();
  if (text.empty())
    return;

  switch (machine_.onSample(text)) {
  case Decision::AcceptFired: {
    const auto s = machine_.snapshot();
    metrics_.updateCounts(s.commandsExecuted, s.messagesSent);
    setLastAction("Pressed Ctrl+Enter");
    break;
  }
  case Decision::ContinueFired: {
    const auto s = machine_.snapshot();
    metrics_.updateCounts(s.commandsExecuted, s.messagesSent);
    setLastAction("Sent continue message");
    break;
  }
  case Decision::EmissionFailed:
    setLastAction("Error sending input, will retry");
    break;
  case Decision::Busy:
    if (lastAction() != "Waiting for generation...")
      setLastAction("Waiting for generation...");
    break;
  case Decision::Dismiss:
    if (lastAction() != "Cancel/Skip button detected, waiting...")
      setLastAction("Cancel/Skip button detected, waiting...");
    break;
  default:
    break;
  }
}

void AutomationCoordinator::readerLoop(io::ConsoleChannel& console) {
  while (running_) {
    auto line = console.readLine(kReaderPoll);
    if (line)
      handleCommand(*line);
    else if (console.eof())
      break; // stdin closed: automation keeps running without operator input
  }
}

autopilot::ui::StatusSnapshot AutomationCoordinator::statusSnapshot() const {
  const auto session = machine_.snapshot();

  ui::StatusSnapshot snap;
  if (session.startTime)
    snap.runtime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - *session.startTime);
  snap.messagesSent = session.messagesSent;
  snap.commandsExecuted = session.commandsExecuted;
  snap.paused = session.isPaused;

  std::lock_guard<std::mutex> lock(statusMtx_);
  snap.stepPath = stepPath_;
  snap.lastAction = lastAction_;
  return snap;
}

std::string AutomationCoordinator::lastAction() const {
  std::lock_guard<std::mutex> lock(statusMtx_);
  return lastAction_;
}

void AutomationCoordinator::setLastAction(const std::string& status) {
  {
    std::lock_guard<std::mutex> lock(statusMtx_);
    lastAction_ = status;
  }
  publishStatus();
}

void AutomationCoordinator::publishStatus() {
  if (!statusSink_)
    return;
  const auto snap = statusSnapshot();
  std::lock_guard<std::mutex> lock(publishMtx_);
  statusSink_(snap);
}

void AutomationCoordinator::say(const std::string& text) {
  if (output_) {
    output_(text);
    return;
  }
  if (console_ && console_->writeLine(text))
    return;
  logger_.info(text);
}

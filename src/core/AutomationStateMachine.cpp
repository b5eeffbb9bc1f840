/* @file AutomationStateMachine.cpp
 * @brief accept / continue dispatch with identity debounce and completion latch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <exception>

// Autopilot headers
#include "core/AutomationStateMachine.hpp"
#include "core/Logger.hpp"

using namespace autopilot::core;

AutomationStateMachine::AutomationStateMachine(ActionEmitter& emitter, Logger& logger,
                                               std::shared_ptr<ErrorMonitor> errMonitor)
    : emitter_(emitter), logger_(logger), errorMonitor_(std::move(errMonitor)) {
  assert(errorMonitor_ && "[AutomationStateMachine] error monitor is nullptr");
}

bool AutomationStateMachine::start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (stopped_ || state_ != AutomationState::Idle)
    return false;
  state_ = AutomationState::Running;
  session_.startTime = std::chrono::system_clock::now();
  return true;
}

bool AutomationStateMachine::pause() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (state_ != AutomationState::Running)
    return false;
  state_ = AutomationState::Paused;
  session_.isPaused = true;
  return true;
}

bool AutomationStateMachine::resume() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (state_ != AutomationState::Paused)
    return false;
  state_ = AutomationState::Running;
  session_.isPaused = false;
  return true;
}

void AutomationStateMachine::stop() {
  std::lock_guard<std::mutex> lock(mtx_);
  state_ = AutomationState::Idle;
  session_.isPaused = false;
  stopped_ = true;
}

AutomationState AutomationStateMachine::state() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}

SessionState AutomationStateMachine::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return session_;
}

Decision AutomationStateMachine::onSample(const std::string& raw) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (state_ != AutomationState::Running)
    return Decision::Skipped;

  const auto text = classify(raw);
  const bool changed = raw != session_.lastText;
  Decision decision = Decision::NoAction;

  if (text.matches(TextCategory::Accept) && changed) {
    logger_.info("Found button: '" + raw + "'");
    if (fire(Action::Accept, "Ctrl+Enter")) {
      ++session_.commandsExecuted;
      session_.waitingForCompletion = true;
      logger_.info("Pressed Ctrl+Enter");
      decision = Decision::AcceptFired;
    } else {
      decision = Decision::EmissionFailed;
    }
  } else if (text.matches(TextCategory::Completed) && session_.waitingForCompletion) {
    logger_.info("Task completed, continuing implementation");
    if (fire(Action::ContinueImplementation, "continue message")) {
      ++session_.messagesSent;
      session_.waitingForCompletion = false;
      logger_.info("Sent continue message");
      decision = Decision::ContinueFired;
    } else {
      decision = Decision::EmissionFailed;
    }
  } else if (text.matches(TextCategory::Busy)) {
    if (changed)
      logger_.info("Waiting for generation...");
    decision = Decision::Busy;
  } else if (text.matches(TextCategory::Dismiss)) {
    if (changed)
      logger_.info("Cancel/Skip button detected, waiting...");
    decision = Decision::Dismiss;
  }

  session_.lastText = raw;
  return decision;
}

bool AutomationStateMachine::emitManual(Action action) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (state_ == AutomationState::Idle)
    return false;
  if (!fire(action, toString(action)))
    return false;
  if (action == Action::Accept)
    ++session_.commandsExecuted;
  else
    ++session_.messagesSent;
  return true;
}

// caller holds mtx_
bool AutomationStateMachine::fire(Action action, const std::string& what) {
  try {
    emitter_.emit(action);
    return true;
  } catch (const std::exception& e) {
    logger_.error("Error sending " + what + ": " + e.what());
    errorMonitor_->notifyFailure(e.what());
    return false;
  } catch (...) {
    logger_.error("Error sending " + what + ": unknown exception");
    errorMonitor_->notifyFailure("[AutomationStateMachine] unknown exception from emitter");
    return false;
  }
}

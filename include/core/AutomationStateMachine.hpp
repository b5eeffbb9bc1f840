#pragma once
/** @file  AutomationStateMachine.hpp
 *  @brief Session state + per-sample dispatch (debounce and completion latch).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/ActionEmitter.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/TextClassifier.hpp"

namespace autopilot {
  namespace core {

    class Logger;

    enum class AutomationState { Idle, Running, Paused };

    inline const char* toString(AutomationState s) {
      switch (s) {
      case AutomationState::Idle:
        return "Idle";
      case AutomationState::Running:
        return "Running";
      case AutomationState::Paused:
        return "Paused";
      default:
        return "Unknown";
      }
    }

    /// What onSample() did with one text sample.
    enum class Decision : std::uint8_t {
      Skipped,        ///< machine not Running
      AcceptFired,    ///< accept chord delivered
      ContinueFired,  ///< continue message delivered
      EmissionFailed, ///< an action was due but the emitter threw
      Busy,           ///< generating/loading text seen
      Dismiss,        ///< cancel/skip text seen
      NoAction
    };

    struct SessionState {
      std::string lastText;
      bool waitingForCompletion{ false };
      bool isPaused{ false };
      std::uint32_t commandsExecuted{ 0 };
      std::uint32_t messagesSent{ 0 };
      std::optional<std::chrono::system_clock::time_point> startTime{};
    };

    /**
 * @class AutomationStateMachine
 * @brief Owns the one SessionState of a run; every public call takes the same lock.
 *
 *  * Idle → start → Running ⇄ Paused; stop() from anywhere is terminal.
 *  * `onSample()` holds the lock across the emitter call, so an operator
 *    pause issued mid-emission lands once that action has finished.
 */
    class AutomationStateMachine {
    public:
      AutomationStateMachine(ActionEmitter& emitter, Logger& logger,
                             std::shared_ptr<ErrorMonitor> errMonitor);

      //---lifecycle----------------------------------------------------------
      bool start();  ///< Idle → Running, stamps startTime
      bool pause();  ///< Running → Paused
      bool resume(); ///< Paused → Running
      void stop();   ///< any → Idle; start() is refused afterwards

      AutomationState state() const;
      bool isRunning() const { return state() == AutomationState::Running; }

      //---sampling-----------------------------------------------------------
      /// Classify \p raw and act on it. No-op unless Running.
      Decision onSample(const std::string& raw);

      /// Operator-requested action (e.g. "next"); counts as a sent message.
      bool emitManual(Action action);

      SessionState snapshot() const;

    private:
      bool fire(Action action, const std::string& what);

      ActionEmitter& emitter_;
      Logger& logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;

      mutable std::mutex mtx_;
      AutomationState state_{ AutomationState::Idle };
      bool stopped_{ false };
      SessionState session_{};
    };

  } // namespace core
} // namespace autopilot

#pragma once

/** @file  AutomationCoordinator.hpp
 *  @brief Public API for autopilot::core::AutomationCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/CommandRegistry.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Settings.hpp"
#include "ui/StatusPanel.hpp"

namespace autopilot {
  namespace io {
    class ConsoleChannel;
  }

  namespace core {

    class AutomationStateMachine;
    class Logger;
    class MetricsRecorder;
    class StepResolver;
    class TextSampler;

    /**
 * @class AutomationCoordinator
 * @brief Cooperative scheduler: one loop drives the poll tick and the slower
 *        checklist refresh; an optional reader thread feeds operator commands.
 *
 *  * Collaborators are injected by reference and must outlive the coordinator.
 *  * `tick()` is public so tests can step the loop deterministically.
 *  * `requestStop()` only clears a flag; the loop and the reader thread exit
 *    before their next iteration, nothing in flight is interrupted.
 */
    class AutomationCoordinator {

    public:
      using Clock = std::chrono::steady_clock;
      using OutputSink = std::function<void(const std::string&)>;
      using StatusSink = std::function<void(const ui::StatusSnapshot&)>;

      AutomationCoordinator(Settings settings, AutomationStateMachine& machine,
                            TextSampler& sampler, StepResolver& resolver,
                            MetricsRecorder& metrics, Logger& logger,
                            std::shared_ptr<ErrorMonitor> errMonitor);
      ~AutomationCoordinator();

      // ---- Public API ----------------------------------------------------------
      void initialize(); ///< Read checklist (throws DocumentReadError), wire commands, start FSM
      void run(io::ConsoleChannel* console = nullptr); ///< Main loop until stop
      void tick(Clock::time_point now); ///< One loop iteration: step refresh + poll
      bool handleCommand(const std::string& line); ///< false if the word is unknown
      void requestStop();

      bool running() const { return running_.load(); }

      /// Overrides where command replies go (default: the run() console, else the log).
      void setOutput(OutputSink sink) { output_ = std::move(sink); }
      void setStatusSink(StatusSink sink) { statusSink_ = std::move(sink); }

      ui::StatusSnapshot statusSnapshot() const;
      std::string lastAction() const;

    private:
      enum class Phase { BOOT, READY, RUNNING, FINISHED };

      void transitionTo(Phase next);
      void registerCommands();
      void refreshStep(Clock::time_point now);
      void pollOnce();
      void setLastAction(const std::string& status);
      void publishStatus();
      void say(const std::string& text);
      void readerLoop(io::ConsoleChannel& console);

      Settings settings_;
      AutomationStateMachine& machine_;
      TextSampler& sampler_;
      StepResolver& resolver_;
      MetricsRecorder& metrics_;
      Logger& logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;

      CommandRegistry commands_;
      OutputSink output_{};
      StatusSink statusSink_{};

      Phase phase_{ Phase::BOOT };
      std::atomic<bool> running_{ false };
      std::thread reader_;
      io::ConsoleChannel* console_{ nullptr }; ///< operator I/O while run() is active
      std::mutex wakeMtx_;
      std::condition_variable wake_;

      mutable std::mutex statusMtx_;
      std::optional<std::vector<std::string>> stepPath_{};
      std::string lastAction_{};
      std::mutex publishMtx_;
    };

  } // namespace core
} // namespace autopilot

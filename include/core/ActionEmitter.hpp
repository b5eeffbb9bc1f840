#pragma once
/** @file  ActionEmitter.hpp
 *  @brief Turns high-level automation actions into key sequences.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Autopilot headers
#include "core/ErrorMonitor.hpp" // emitter reports per-channel faults to the monitor
#include "io/InputChannel.hpp"   // emitter owns the channels and requires full type knowledge

namespace autopilot {
  namespace core {

    enum class Action : std::uint8_t { Accept, ContinueImplementation, NextStep };

    inline const char* toString(Action a) {
      switch (a) {
      case Action::Accept:
        return "Accept";
      case Action::ContinueImplementation:
        return "ContinueImplementation";
      case Action::NextStep:
        return "NextStep";
      default:
        return "Unknown";
      }
    }

    /**
 * @class ActionEmitter
 * @brief Input-emission collaborator seen by the state machine.
 *
 *  `emit()` throws `EmissionError` when the action could not be delivered.
 */
    class ActionEmitter {
    public:
      virtual ~ActionEmitter() = default;
      virtual void emit(Action action) = 0;
    };

    struct EmitterTiming {
      std::chrono::milliseconds actionDelay{ 500 }; ///< settle time before any action
      std::chrono::milliseconds keyHold{ 150 };     ///< gap between chord press steps
      std::chrono::milliseconds typingPause{ 500 }; ///< gap around typed messages
    };

    struct EmitterMessages {
      std::string continueImplementation{
        "continue with the steps and update the project steps with what we have completed and "
        "whats in progress and the implementation unless there is something critical you need to "
        "add or unless the test scripts dont show 100% functionality"
      };
      std::string nextStep{ "move on to the next step" };
    };

    /**
 * @class KeyboardActionEmitter
 * @brief Fans the accept chord out over every channel; types messages on the primary one.
 *
 *  * Accept (Ctrl+Enter) goes through each channel in turn. Delivery counts as
 *    successful when at least one channel accepted it.
 *  * Messages (Ctrl+/ → text → Enter) use only channels_[0]; typing twice would
 *    duplicate the text.
 */
    class KeyboardActionEmitter : public ActionEmitter {
    public:
      using Sleeper = std::function<void(std::chrono::milliseconds)>;

      KeyboardActionEmitter(std::vector<std::unique_ptr<io::InputChannel>> channels,
                            std::shared_ptr<ErrorMonitor> errMonitor, EmitterTiming timing = {},
                            EmitterMessages messages = {}, Sleeper sleeper = {});

      void emit(Action action) override;

      const EmitterMessages& messages() const { return messages_; }

    private:
      void pressAccept();
      void sendMessage(const std::string& text);
      void pause(std::chrono::milliseconds d) const;

      std::vector<std::unique_ptr<io::InputChannel>> channels_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      EmitterTiming timing_;
      EmitterMessages messages_;
      Sleeper sleeper_;
    };

  } // namespace core
} // namespace autopilot

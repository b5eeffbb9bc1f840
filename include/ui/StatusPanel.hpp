#pragma once
/** @file  StatusPanel.hpp
 *  @brief Console control-panel renderer (the thin terminal front end).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace autopilot {
  namespace ui {

    /// Everything the panel shows; assembled by the coordinator.
    struct StatusSnapshot {
      std::chrono::seconds runtime{ 0 };
      std::optional<std::vector<std::string>> stepPath{}; ///< nullopt → "No current step found"
      std::uint32_t messagesSent{ 0 };
      std::uint32_t commandsExecuted{ 0 };
      std::string lastAction{};
      bool paused{ false };
    };

    /**
 * @class StatusPanel
 * @brief Pure renderer: snapshot in, boxed text out. Printing is the caller's job.
 */
    class StatusPanel {
    public:
      /// "HH:MM:SS"
      static std::string formatRuntime(std::chrono::seconds runtime);

      std::string render(const StatusSnapshot& snap) const;

      /// ANSI clear-screen + home; the console front end prefixes render() with it.
      static constexpr const char* kClearScreen = "\033[2J\033[H";
    };

  } // namespace ui
} // namespace autopilot

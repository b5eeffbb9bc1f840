/* @file StatusPanel.cpp
 * @brief boxed status rendering
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string_view>

#include "core/TextUtil.hpp"
#include "ui/StatusPanel.hpp"

using namespace autopilot::ui;
using autopilot::core::padRight;
using autopilot::core::utf8Length;
using autopilot::core::utf8Truncate;

namespace {

  constexpr std::size_t kInner = 54;
  constexpr std::size_t kStepWidth = 45;
  constexpr std::string_view kActionLabel = "Last Action: ";
  constexpr std::size_t kActionMax = kInner - kActionLabel.size();

  std::string rule(const char* left, const char* right) {
    std::string out = left;
    for (std::size_t i = 0; i < kInner + 2; ++i)
      out += "═";
    return out + right;
  }

  std::string line(const std::string& content) { return "║ " + padRight(content, kInner) + " ║\n"; }

} // namespace

std::string StatusPanel::formatRuntime(std::chrono::seconds runtime) {
  const long long total = runtime.count() < 0 ? 0 : runtime.count();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", total / 3600, (total % 3600) / 60,
                total % 60);
  return buf;
}

std::string StatusPanel::render(const StatusSnapshot& snap) const {
  std::string out;
  out += rule("╔", "╗") + "\n";
  out += line("           AUTOPILOT CONTROL PANEL");
  out += rule("╠", "╣") + "\n";
  out += line("Runtime: " + formatRuntime(snap.runtime) + (snap.paused ? "  [PAUSED]" : ""));

  if (snap.stepPath && !snap.stepPath->empty()) {
    out += line("Current Step:");
    for (std::size_t i = 0; i < snap.stepPath->size(); ++i) {
      const std::string part = std::string(2 * i, ' ') + (*snap.stepPath)[i];
      out += line("  " + padRight(part, kStepWidth));
    }
  } else {
    out += line("No current step found");
  }

  out += line("Messages Sent: " + std::to_string(snap.messagesSent));
  out += line("Commands Executed: " + std::to_string(snap.commandsExecuted));
  out += rule("╠", "╣") + "\n";
  if (!snap.lastAction.empty()) {
    std::string action = snap.lastAction;
    if (utf8Length(action) > kActionMax)
      action = utf8Truncate(action, kActionMax - 3) + "...";
    out += line(std::string(kActionLabel) + action);
  }
  out += rule("╚", "╝") + "\n";
  return out;
}

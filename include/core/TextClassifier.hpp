#pragma once
/** @file  TextClassifier.hpp
 *  @brief Maps noisy OCR text onto the handful of button semantics we act on.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace autopilot {
  namespace core {

    /// Listed in dispatch precedence order.
    enum class TextCategory : std::uint8_t { Accept, Completed, Busy, Dismiss, Unknown };

    inline const char* toString(TextCategory c) {
      switch (c) {
      case TextCategory::Accept:
        return "Accept";
      case TextCategory::Completed:
        return "Completed";
      case TextCategory::Busy:
        return "Busy";
      case TextCategory::Dismiss:
        return "Dismiss";
      default:
        return "Unknown";
      }
    }

    /**
 * @struct ClassifiedText
 * @brief Result of one classification.
 *
 *  Phrase sets are matched independently, so a string can hit several;
 *  `category` is the first hit in precedence order, `matches()` exposes all.
 */
    struct ClassifiedText {
      std::string raw;
      TextCategory category{ TextCategory::Unknown };
      std::uint8_t matchMask{ 0 };

      bool matches(TextCategory c) const {
        return c != TextCategory::Unknown && (matchMask & (1u << static_cast<unsigned>(c)));
      }
    };

    // Phrase tables. "command" on its own is broad and will hit any text that
    // mentions the word; kept because real buttons render as "Command ⌘⏎".
    inline constexpr std::array<std::string_view, 7> kAcceptPhrases{
      "run command", "run this command", "run the command", "accept",
      "accept all",  "command",          "command ⌘"
    };
    inline constexpr std::array<std::string_view, 4> kCompletedPhrases{ "completed", "done",
                                                                        "success", "finished" };
    inline constexpr std::array<std::string_view, 2> kBusyPhrases{ "generating", "loading" };
    inline constexpr std::array<std::string_view, 2> kDismissPhrases{ "cancel", "skip" };

    /// Pure and total: never throws, empty input is `Unknown`.
    ClassifiedText classify(std::string_view raw);

  } // namespace core
} // namespace autopilot

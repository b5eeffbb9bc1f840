#pragma once
/** @file  StepIndex.hpp
 *  @brief Checklist document parser (section → subsection → step).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace autopilot {
  namespace core {

    /**
 * @enum StepStatus
 * @brief Completion state carried by a checklist line's glyph.
 */
    enum class StepStatus { Complete, InProgress, Incomplete };

    inline constexpr std::string_view kCompleteGlyph = "✓";
    inline constexpr std::string_view kInProgressGlyph = "🔄";
    inline constexpr std::string_view kIncompleteGlyph = "❌";

    /// Glyph used for \p s in checklists, reports and the metrics file.
    std::string_view toGlyph(StepStatus s);

    inline const char* toString(StepStatus s) {
      switch (s) {
      case StepStatus::Complete:
        return "complete";
      case StepStatus::InProgress:
        return "in_progress";
      case StepStatus::Incomplete:
        return "incomplete";
      default:
        return "unknown";
      }
    }

    struct Step {
      std::string section;
      std::string subsection; ///< empty when no ### heading is open
      std::string label;
      StepStatus status{ StepStatus::Complete };
      std::size_t sourcePosition{ 0 }; ///< zero-based line index

      bool operator==(const Step&) const = default;
    };

    /// Steps in document line order.
    using StepIndex = std::vector<Step>;

    /**
 * @brief Scan \p documentText line by line and collect every glyph-bearing line.
 *
 *  * `## ` opens a section and clears the subsection, `### ` opens a subsection.
 *  * Status precedence: in-progress, then incomplete, then complete.
 *  * Never throws; a document without headings yields empty section fields.
 */
    StepIndex parseDocument(const std::string& documentText);

    /// Read the whole checklist file or throw `DocumentReadError`.
    std::string readDocument(const std::string& path);

    /**
 * @struct DocumentDiagnostics
 * @brief Startup sanity report for a checklist.
 */
    struct DocumentDiagnostics {
      bool hasSections{ false };
      bool hasSubsections{ false };
      std::size_t totalSteps{ 0 };
      std::size_t completed{ 0 };
      std::size_t inProgress{ 0 };
      std::size_t incomplete{ 0 };
      std::vector<std::string> issues;   ///< automation refuses to start
      std::vector<std::string> warnings; ///< informational

      bool ok() const { return issues.empty(); }
    };

    DocumentDiagnostics diagnoseDocument(const std::string& documentText);

  } // namespace core
} // namespace autopilot

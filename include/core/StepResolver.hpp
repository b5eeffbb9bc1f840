#pragma once
/** @file  StepResolver.hpp
 *  @brief Picks the checklist's "current step" and caches it between reads.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/StepIndex.hpp"

namespace autopilot {
  namespace core {

    struct ResolvedStep {
      std::vector<std::string> path; ///< [section, subsection?, label]

      std::string joined(std::string_view sep = " > ") const;
      bool operator==(const ResolvedStep&) const = default;
    };

    /**
 * @class StepResolver
 * @brief Rate-limited, content-keyed view of one checklist file.
 *
 *  * The file is read at most once per check interval.
 *  * The document is reparsed only when its raw text changed.
 *  * A failed read keeps the last good result (reported via RefreshResult).
 */
    class StepResolver {
    public:
      using Clock = std::chrono::steady_clock;
      using Reader = std::function<std::string(const std::string&)>;

      enum class RefreshResult { NotDue, Unchanged, Reparsed, ReadFailed };

      explicit StepResolver(std::string documentPath,
                            std::chrono::milliseconds checkInterval = std::chrono::seconds{ 1 },
                            Reader reader = &readDocument);

      /// Earliest in-progress step, else earliest incomplete step, else nullopt.
      static std::optional<ResolvedStep> resolve(const StepIndex& index);

      /// Re-check the document if the interval elapsed since the last check.
      RefreshResult refresh(Clock::time_point now);

      const std::optional<ResolvedStep>& current() const { return current_; }
      const StepIndex& index() const { return index_; }
      const std::string& lastError() const { return lastError_; }
      const std::string& documentPath() const { return path_; }

    private:
      std::string path_;
      std::chrono::milliseconds interval_;
      Reader reader_;

      std::optional<Clock::time_point> lastCheck_{};
      std::optional<std::string> lastContent_{};
      StepIndex index_{};
      std::optional<ResolvedStep> current_{};
      std::string lastError_{};
    };

  } // namespace core
} // namespace autopilot

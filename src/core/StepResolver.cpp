/* @file StepResolver.cpp
 * @brief current-step selection (priority + earliest position) with a read cache
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// Autopilot headers
#include "core/Errors.hpp"
#include "core/StepResolver.hpp"

using namespace autopilot::core;

namespace {

  const Step* earliestWith(const StepIndex& index, StepStatus status) {
    const Step* best = nullptr;
    for (const auto& step : index) {
      if (step.status != status)
        continue;
      if (!best || step.sourcePosition < best->sourcePosition)
        best = &step;
    }
    return best;
  }

} // namespace

std::string ResolvedStep::joined(std::string_view sep) const {
  std::string out;
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (i)
      out += sep;
    out += path[i];
  }
  return out;
}

StepResolver::StepResolver(std::string documentPath, std::chrono::milliseconds checkInterval,
                           Reader reader)
    : path_(std::move(documentPath)), interval_(checkInterval), reader_(std::move(reader)) {}

std::optional<ResolvedStep> StepResolver::resolve(const StepIndex& index) {
  const Step* pick = earliestWith(index, StepStatus::InProgress);
  if (!pick)
    pick = earliestWith(index, StepStatus::Incomplete);
  if (!pick)
    return std::nullopt;

  ResolvedStep resolved;
  resolved.path.push_back(pick->section);
  if (!pick->subsection.empty())
    resolved.path.push_back(pick->subsection);
  resolved.path.push_back(pick->label);
  return resolved;
}

StepResolver::RefreshResult StepResolver::refresh(Clock::time_point now) {
  if (lastCheck_ && now - *lastCheck_ < interval_)
    return RefreshResult::NotDue;
  lastCheck_ = now;

  std::string content;
  try {
    content = reader_(path_);
  } catch (const DocumentReadError& e) {
    lastError_ = e.what();
    return RefreshResult::ReadFailed;
  }
  lastError_.clear();

  if (lastContent_ && *lastContent_ == content)
    return RefreshResult::Unchanged;

  index_ = parseDocument(content);
  current_ = resolve(index_);
  lastContent_ = std::move(content);
  return RefreshResult::Reparsed;
}

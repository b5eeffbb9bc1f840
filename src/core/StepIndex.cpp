/* @file StepIndex.cpp
 * @brief line-oriented checklist parser + startup diagnostics
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <sstream>

// Autopilot headers
#include "core/Errors.hpp"
#include "core/StepIndex.hpp"

using namespace autopilot::core;

namespace {

  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  constexpr std::string_view kSectionPrefix = "## ";
  constexpr std::string_view kSubsectionPrefix = "### ";

  std::string_view trim(std::string_view s, std::string_view chars = kWhitespace) {
    const auto first = s.find_first_not_of(chars);
    if (first == std::string_view::npos)
      return {};
    const auto last = s.find_last_not_of(chars);
    return s.substr(first, last - first + 1);
  }

  bool contains(std::string_view line, std::string_view glyph) {
    return line.find(glyph) != std::string_view::npos;
  }

  bool hasAnyGlyph(std::string_view line) {
    return contains(line, kInProgressGlyph) || contains(line, kIncompleteGlyph) ||
           contains(line, kCompleteGlyph);
  }

  void eraseAll(std::string& s, std::string_view needle) {
    for (auto pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos))
      s.erase(pos, needle.size());
  }

  std::string stripToLabel(std::string_view line) {
    std::string out{ line };
    eraseAll(out, kInProgressGlyph);
    eraseAll(out, kIncompleteGlyph);
    eraseAll(out, kCompleteGlyph);
    // list dashes first, then any whitespace left behind by the glyphs
    return std::string{ trim(trim(out, "- "), kWhitespace) };
  }

  StepStatus statusOf(std::string_view line) {
    if (contains(line, kInProgressGlyph))
      return StepStatus::InProgress;
    if (contains(line, kIncompleteGlyph))
      return StepStatus::Incomplete;
    return StepStatus::Complete;
  }

} // namespace

std::string_view autopilot::core::toGlyph(StepStatus s) {
  switch (s) {
  case StepStatus::InProgress:
    return kInProgressGlyph;
  case StepStatus::Incomplete:
    return kIncompleteGlyph;
  case StepStatus::Complete:
  default:
    return kCompleteGlyph;
  }
}

StepIndex autopilot::core::parseDocument(const std::string& documentText) {
  StepIndex index;
  std::string section;
  std::string subsection;

  std::istringstream in{ documentText };
  std::string raw;
  for (std::size_t lineNo = 0; std::getline(in, raw); ++lineNo) {
    const auto line = trim(raw);
    if (line.empty())
      continue;

    if (line.starts_with(kSectionPrefix)) {
      section = std::string{ trim(line.substr(kSectionPrefix.size())) };
      subsection.clear();
    } else if (line.starts_with(kSubsectionPrefix)) {
      subsection = std::string{ trim(line.substr(kSubsectionPrefix.size())) };
    }

    if (!hasAnyGlyph(line))
      continue;

    index.push_back(Step{ section, subsection, stripToLabel(line), statusOf(line), lineNo });
  }
  return index;
}

std::string autopilot::core::readDocument(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
    throw DocumentReadError("[StepIndex] checklist not found: " + path);

  std::ifstream f(path, std::ios::binary);
  if (!f.is_open())
    throw DocumentReadError("[StepIndex] cannot open checklist: " + path);

  std::ostringstream buf;
  buf << f.rdbuf();
  if (f.bad())
    throw DocumentReadError("[StepIndex] read failed: " + path);
  return buf.str();
}

DocumentDiagnostics autopilot::core::diagnoseDocument(const std::string& documentText) {
  DocumentDiagnostics diag;

  std::istringstream in{ documentText };
  std::string raw;
  while (std::getline(in, raw)) {
    const auto line = trim(raw);
    if (line.starts_with(kSectionPrefix))
      diag.hasSections = true;
    else if (line.starts_with(kSubsectionPrefix))
      diag.hasSubsections = true;
  }

  for (const auto& step : parseDocument(documentText)) {
    ++diag.totalSteps;
    switch (step.status) {
    case StepStatus::Complete:
      ++diag.completed;
      break;
    case StepStatus::InProgress:
      ++diag.inProgress;
      break;
    case StepStatus::Incomplete:
      ++diag.incomplete;
      break;
    }
  }

  if (!diag.hasSections)
    diag.issues.emplace_back("No sections (##) found. File should have sections marked with ##");
  if (diag.inProgress == 0 && diag.incomplete == 0)
    diag.issues.emplace_back("No progress (🔄) or incomplete (❌) markers found");
  if (diag.inProgress > 1)
    diag.warnings.emplace_back("Multiple in-progress (🔄) steps found: " +
                               std::to_string(diag.inProgress));
  return diag;
}

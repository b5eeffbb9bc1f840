/* @file TextClassifier.cpp
 * @brief case-insensitive phrase-membership classification
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Autopilot headers
#include "core/TextClassifier.hpp"
#include "core/TextUtil.hpp"

using namespace autopilot::core;

namespace {

  template <std::size_t N>
  bool anyIn(const std::string& text, const std::array<std::string_view, N>& phrases) {
    return std::any_of(phrases.begin(), phrases.end(), [&](std::string_view p) {
      return text.find(p) != std::string::npos;
    });
  }

  void mark(ClassifiedText& out, TextCategory c) {
    out.matchMask |= static_cast<std::uint8_t>(1u << static_cast<unsigned>(c));
    if (out.category == TextCategory::Unknown)
      out.category = c;
  }

} // namespace

ClassifiedText autopilot::core::classify(std::string_view raw) {
  ClassifiedText out;
  out.raw = std::string(raw);

  // ASCII-only folding; "⌘" and other multi-byte glyphs pass through untouched
  const auto text = toLowerCopy(raw);
  if (anyIn(text, kAcceptPhrases))
    mark(out, TextCategory::Accept);
  if (anyIn(text, kCompletedPhrases))
    mark(out, TextCategory::Completed);
  if (anyIn(text, kBusyPhrases))
    mark(out, TextCategory::Busy);
  if (anyIn(text, kDismissPhrases))
    mark(out, TextCategory::Dismiss);
  return out;
}

#pragma once
/** @file  TextUtil.hpp
 *  @brief UTF-8 aware width helpers for the boxed console reports.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace autopilot::core {

  /// Number of code points (continuation bytes are not counted).
  std::size_t utf8Length(std::string_view s);

  /// First \p maxChars code points of \p s.
  std::string utf8Truncate(std::string_view s, std::size_t maxChars);

  /// \p s truncated to \p width code points, then space-padded to exactly \p width.
  std::string padRight(std::string_view s, std::size_t width);

  /// Leading/trailing whitespace removed.
  std::string trimCopy(std::string_view s);

  /// ASCII lowercase copy; non-ASCII bytes are kept as-is.
  std::string toLowerCopy(std::string_view s);

} // namespace autopilot::core

/* @file TextUtil.cpp
 * @brief code-point counting / padding helpers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/TextUtil.hpp"

#include <algorithm>
#include <cctype>

namespace autopilot::core {

  namespace {
    bool isContinuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }
  } // namespace

  std::size_t utf8Length(std::string_view s) {
    return static_cast<std::size_t>(
        std::count_if(s.begin(), s.end(), [](char c) { return !isContinuation(c); }));
  }

  std::string utf8Truncate(std::string_view s, std::size_t maxChars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
      if (isContinuation(s[i]))
        continue;
      if (chars == maxChars)
        return std::string(s.substr(0, i));
      ++chars;
    }
    return std::string(s);
  }

  std::string padRight(std::string_view s, std::size_t width) {
    std::string out = utf8Truncate(s, width);
    out.append(width - utf8Length(out), ' ');
    return out;
  }

  std::string trimCopy(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos)
      return {};
    return std::string(s.substr(first, s.find_last_not_of(ws) - first + 1));
  }

  std::string toLowerCopy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
  }

} // namespace autopilot::core

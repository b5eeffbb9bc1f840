/* @file CommandRegistry.cpp
 * @brief operator command lookup
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/CommandRegistry.hpp"
#include "core/TextUtil.hpp"

using namespace autopilot::core;

bool CommandRegistry::registerCommand(const std::string& word, Handler handler) {
  return handlers_.emplace(toLowerCopy(word), std::move(handler)).second;
}

bool CommandRegistry::registerAliases(const std::vector<std::string>& words,
                                      const Handler& handler) {
  bool all = true;
  for (const auto& w : words)
    all = registerCommand(w, handler) && all;
  return all;
}

bool CommandRegistry::dispatch(const std::string& line) const {
  const auto trimmed = trimCopy(line);
  if (trimmed.empty())
    return false;

  const auto split = trimmed.find_first_of(" \t");
  const auto word = toLowerCopy(trimmed.substr(0, split));
  const auto argument = split == std::string::npos ? std::string{} : trimCopy(trimmed.substr(split));

  auto it = handlers_.find(word);
  if (it == handlers_.end())
    return false;
  it->second(argument);
  return true;
}

bool CommandRegistry::contains(const std::string& word) const {
  return handlers_.count(toLowerCopy(word)) != 0;
}

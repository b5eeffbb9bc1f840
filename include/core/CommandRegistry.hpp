#pragma once
/** @file  CommandRegistry.hpp
 *  @brief Runtime registry that maps operator command words to handlers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace autopilot::core {

  /**
 * @class CommandRegistry
 * @brief Register & dispatch line-oriented operator commands by first word.
 *
 *  * Keeps AutomationCoordinator decoupled from how commands are typed in.
 *  * Command words are matched case-insensitively; the argument keeps its case.
 */
  class CommandRegistry {
  public:
    using Handler = std::function<void(const std::string& argument)>;

    /// Register a handler under \p word.  Returns false on duplicate.
    bool registerCommand(const std::string& word, Handler handler);

    /// Register the same handler under several words (e.g. stop/exit/quit).
    bool registerAliases(const std::vector<std::string>& words, const Handler& handler);

    /// Split \p line into word + argument and run the handler; false if unknown/blank.
    bool dispatch(const std::string& line) const;

    bool contains(const std::string& word) const;

  private:
    std::unordered_map<std::string, Handler> handlers_;
  };

} // namespace autopilot::core

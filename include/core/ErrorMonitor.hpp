#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace autopilot::core {

  /**
 * @class ErrorMonitor
 * @brief Poll loop, operator thread and emitter call `notifyFailure()`; the
 *        registered escalation callback runs once per unique message until
 *        the subsystem that sent it recovers.
 *
 * * Thread-safe (mutex-protected set).
 * * Debounces duplicate failures so a recognition error that repeats every
 *   tick produces one log line, not one per poll.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that reports a fault (the coordinator logs it).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; forwards new messages to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Every notification counts, duplicates included.
    std::size_t failureCount() const;

    /// Forget the whole de-dupe history.
    void reset();

    /// A subsystem worked again: forget its messages (those starting with
    /// `source`) so the next failure from it is escalated afresh.
    void recover(std::string_view source);

  private:
    std::function<void(const std::string&)> escalation_{};
    std::unordered_set<std::string> seen_; ///< de-dupe list
    std::size_t count_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace autopilot::core

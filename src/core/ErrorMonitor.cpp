/* @file ErrorMonitor.cpp
 * @brief de-duplicating failure sink
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ErrorMonitor.hpp"

#include <utility>

namespace autopilot {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++count_;
        if (!seen_.insert(message).second)
          return;
        cb = escalation_;
      }
      // invoked outside the lock so the callback may log or call back in
      if (cb)
        cb(message);
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return count_;
    }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    void ErrorMonitor::recover(std::string_view source) {
      std::lock_guard<std::mutex> lock(mtx_);
      std::erase_if(seen_, [source](const std::string& msg) { return msg.starts_with(source); });
    }

  } // namespace core
} // namespace autopilot

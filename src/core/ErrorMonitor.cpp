/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// boardlink headers
#include "core/ErrorMonitor.hpp"

namespace boardlink {
  namespace core {

    ErrorMonitor::ErrorMonitor(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!recordIfNew(message))
        return;

      if (logger_)
        logger_->error("ErrorMonitor", message);

      std::function<void(const std::string&)> cb;
      {
        std::lock_guard lock(mtx_);
        cb = escalation_;
      }
      // unlocked: the callback may re-enter failures()
      if (cb)
        cb(message);
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard lock(mtx_);
      return seen_;
    }

    bool ErrorMonitor::recordIfNew(const std::string& message) {
      std::lock_guard lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace boardlink

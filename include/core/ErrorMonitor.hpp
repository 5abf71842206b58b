#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Logger.hpp"

namespace boardlink::core {

  /**
 * @class ErrorMonitor
 * @brief Boards and the Robot call `notifyFailure()`; we log the fault and call
 *        the registered escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a repeated safing fault is only escalated once.
 */
  class ErrorMonitor {
  public:
    explicit ErrorMonitor(std::shared_ptr<Logger> logger = defaultLogger());
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the application.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Every unique failure seen so far, oldest first.
    std::vector<std::string> failures() const;

  private:
    bool recordIfNew(const std::string& message);

    std::shared_ptr<Logger> logger_;
    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace boardlink::core

#pragma once
/** @file  SafetyReport.hpp
 *  @brief Aggregated outcome of a best-effort make-safe pass.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <utility>
#include <vector>

namespace boardlink::core {

  struct ComponentFault {
    std::string board;     ///< "<board name> - <serial>"
    std::string component; ///< e.g. "Motor"
    int identifier{ 0 };
    std::string message;

    /// "<board>: <component> <identifier>: <message>"
    std::string toString() const;
  };

  /**
 * @class SafetyReport
 * @brief Faults recorded while safing; empty means every component reached its
 *        safe state.
 */
  class SafetyReport {
  public:
    void add(ComponentFault fault) { faults_.push_back(std::move(fault)); }
    void merge(const SafetyReport& other) {
      faults_.insert(faults_.end(), other.faults_.begin(), other.faults_.end());
    }

    bool ok() const { return faults_.empty(); }
    const std::vector<ComponentFault>& faults() const { return faults_; }

    /// One fault per line; empty string when ok.
    std::string toString() const;

  private:
    std::vector<ComponentFault> faults_;
  };

} // namespace boardlink::core

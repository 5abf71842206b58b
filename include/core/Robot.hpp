#pragma once
/** @file  Robot.hpp
 *  @brief Owns the board groups an application discovered and keeps them safe.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

// boardlink headers
#include "backends/Environment.hpp"
#include "boards/BoardGroup.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SafetyReport.hpp"

namespace boardlink::core {

  /**
 * @class Robot
 * @brief Entry point for applications: discovers boards through an injected
 *        `Environment` and makes all of them safe on request and on destruction.
 *
 *  * Groups are discovered once; later `discover<B>()` calls return the same group.
 *  * Every fault found while safing is reported to the `ErrorMonitor`.
 */
  class Robot {
  public:
    Robot(backends::Environment environment, std::shared_ptr<ErrorMonitor> errorMonitor,
          std::shared_ptr<Logger> logger = defaultLogger());
    ~Robot();

    /// @throws NotSupportedByEnvironment when the environment cannot discover \p BoardT.
    template <typename BoardT> boards::BoardGroup<BoardT>& discover() {
      for (auto& [type, holder] : groups_) {
        if (type == std::type_index(typeid(BoardT)))
          return static_cast<Holder<BoardT>&>(*holder).group;
      }
      auto holder = std::make_unique<Holder<BoardT>>(environment_.boardGroup<BoardT>());
      auto& group = holder->group;
      logger_->info("Robot", "discovered " + std::to_string(group.count()) + " " +
                                 BoardT::kName + " through " + group.backendName());
      groups_.emplace_back(std::type_index(typeid(BoardT)), std::move(holder));
      return group;
    }

    /// Safes every discovered board, oldest group first, and reports each fault.
    SafetyReport makeSafe();

    const backends::Environment& environment() const { return environment_; }

    Robot(const Robot&) = delete;
    Robot& operator=(const Robot&) = delete;

  private:
    struct GroupHolder {
      virtual ~GroupHolder() = default;
      virtual SafetyReport makeSafe() = 0;
    };

    template <typename BoardT> struct Holder : GroupHolder {
      explicit Holder(boards::BoardGroup<BoardT> g) : group(std::move(g)) {}
      SafetyReport makeSafe() override { return group.makeSafe(); }
      boards::BoardGroup<BoardT> group;
    };

    backends::Environment environment_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::shared_ptr<Logger> logger_;
    std::vector<std::pair<std::type_index, std::unique_ptr<GroupHolder>>> groups_;
  };

} // namespace boardlink::core

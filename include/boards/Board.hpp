#pragma once
/** @file  Board.hpp
 *  @brief Abstract base class for every board.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "backends/Backend.hpp"
#include "core/SafetyReport.hpp"

namespace boardlink::boards {

  /**
 * @class Board
 * @brief Groups the components of one physical unit and owns its backend.
 *
 *  * Components are built in the derived constructor and live as long as the board.
 *  * The board never performs I/O itself; identity calls go to the backend.
 *  * Non-copyable, non-movable (components hold references into the backend).
 */
  class Board {
  public:
    explicit Board(std::unique_ptr<backends::Backend> backend);
    virtual ~Board() = default;

    virtual std::string name() const = 0;

    std::string serialNumber() const { return backend_->serialNumber(); }
    std::optional<std::string> firmwareVersion() const { return backend_->firmwareVersion(); }

    /// Commands every component with a safe state into it. Component failures are
    /// collected in the returned report; they are never thrown.
    core::SafetyReport makeSafe();

    /// "<name> - <serial>"
    std::string toString() const;

    Board(const Board&) = delete;
    Board& operator=(const Board&) = delete;

  protected:
    /// Called by makeSafe(); implementations wrap each component in attempt().
    virtual void makeComponentsSafe(core::SafetyReport& report) = 0;

    /// Runs \p action, recording any `std::exception` it throws against the component.
    template <typename Action>
    void attempt(core::SafetyReport& report, const char* component, int identifier,
                 Action&& action) {
      try {
        std::forward<Action>(action)();
      } catch (const std::exception& e) {
        report.add(core::ComponentFault{ safeDescription(), component, identifier, e.what() });
      }
    }

    /// The backend as the concrete type the derived constructor was given.
    template <typename BackendT> BackendT& backendAs() {
      return static_cast<BackendT&>(*backend_);
    }

  private:
    /// toString() that falls back to the name when the serial cannot be read.
    std::string safeDescription() const;

    std::unique_ptr<backends::Backend> backend_;
  };

} // namespace boardlink::boards

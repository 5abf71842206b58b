/* @file MotorBoardConsoleBackend.cpp
 * @brief console motor board
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// boardlink headers
#include "backends/console/MotorBoardConsoleBackend.hpp"
#include "core/Errors.hpp"

namespace boardlink::backends {

  namespace {
    void checkMotor(int identifier) {
      if (identifier < 0 || identifier > 1)
        throw core::InvalidArgument("Invalid motor identifier: " + std::to_string(identifier) +
                                    ", valid values are: 0, 1");
    }
  } // namespace

  std::vector<std::unique_ptr<boards::MotorBoard>>
  MotorBoardConsoleBackend::discover(const Config& config) {
    return discoverEach<MotorBoardConsoleBackend>(config);
  }

  components::MotorState MotorBoardConsoleBackend::getMotorState(int identifier) {
    checkMotor(identifier);
    return states_[identifier];
  }

  void MotorBoardConsoleBackend::setMotorState(int identifier,
                                               const components::MotorState& state) {
    checkMotor(identifier);
    states_[identifier] = state;
    console().info("Setting motor " + std::to_string(identifier) + " to " +
                   components::toString(state) + ".");
  }

} // namespace boardlink::backends

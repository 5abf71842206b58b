/* @file ServoBoardConsoleBackend.cpp
 * @brief console servo board
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>

// boardlink headers
#include "backends/console/ServoBoardConsoleBackend.hpp"
#include "core/Errors.hpp"

namespace boardlink::backends {

  namespace {
    void checkServo(int identifier) {
      if (identifier < 0 || identifier >= boards::ServoBoard::kServoCount)
        throw core::InvalidArgument("Invalid servo identifier: " + std::to_string(identifier) +
                                    ", valid values are: 0 - 11");
    }
  } // namespace

  std::vector<std::unique_ptr<boards::ServoBoard>>
  ServoBoardConsoleBackend::discover(const Config& config) {
    return discoverEach<ServoBoardConsoleBackend>(config);
  }

  components::ServoPosition ServoBoardConsoleBackend::getServoPosition(int identifier) {
    checkServo(identifier);
    return positions_[identifier];
  }

  void ServoBoardConsoleBackend::setServoPosition(int identifier,
                                                  components::ServoPosition position) {
    checkServo(identifier);
    positions_[identifier] = position;

    std::ostringstream text;
    if (position)
      text << *position;
    else
      text << "unpowered";
    console().info("Setting servo " + std::to_string(identifier) + " to " + text.str() + ".");
  }

} // namespace boardlink::backends

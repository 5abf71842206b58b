/* @file Motor.cpp
 * @brief motor power validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>

// boardlink headers
#include "components/Motor.hpp"
#include "core/Errors.hpp"

namespace boardlink::components {

  std::string toString(const MotorState& state) {
    if (const auto* special = std::get_if<MotorSpecialState>(&state))
      return *special == MotorSpecialState::Coast ? "COAST" : "BRAKE";

    std::ostringstream out;
    out << std::get<double>(state);
    return out.str();
  }

  void Motor::setPower(const MotorState& state) {
    if (const auto* power = std::get_if<double>(&state)) {
      if (!(*power >= -1.0 && *power <= 1.0))
        throw core::InvalidArgument("Motor power must be between -1 and 1, got " +
                                    toString(state));
    }
    backend_.setMotorState(identifier(), state);
  }

} // namespace boardlink::components

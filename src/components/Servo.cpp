/* @file Servo.cpp
 * @brief servo position validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// boardlink headers
#include "components/Servo.hpp"
#include "core/Errors.hpp"

namespace boardlink::components {

  void Servo::setPosition(ServoPosition position) {
    if (position && !(*position >= -1.0 && *position <= 1.0))
      throw core::InvalidArgument("Servo position must be between -1 and 1, got " +
                                  std::to_string(*position));
    backend_.setServoPosition(identifier(), position);
  }

} // namespace boardlink::components

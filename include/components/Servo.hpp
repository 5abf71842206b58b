#pragma once
/** @file  Servo.hpp
 *  @brief Standard hobby servomotor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>

#include "components/Component.hpp"

namespace boardlink::components {

  /// Position in [-1, 1]; nullopt powers the servo down.
  using ServoPosition = std::optional<double>;

  class ServoInterface {
  public:
    virtual ~ServoInterface() = default;

    virtual ServoPosition getServoPosition(int identifier) = 0;
    virtual void setServoPosition(int identifier, ServoPosition position) = 0;
  };

  class Servo : public Component {
  public:
    Servo(int identifier, ServoInterface& backend) : Component(identifier), backend_(backend) {}

    ServoPosition position() const { return backend_.getServoPosition(identifier()); }

    /// Throws `core::InvalidArgument` for positions outside [-1, 1].
    void setPosition(ServoPosition position);

  private:
    ServoInterface& backend_;
  };

} // namespace boardlink::components

#pragma once
/** @file  Motor.hpp
 *  @brief Brushed DC motor output.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <variant>

#include "components/Component.hpp"

namespace boardlink::components {

  enum class MotorSpecialState { Coast, Brake };

  /// Either a power in [-1, 1] or one of the special states.
  using MotorState = std::variant<double, MotorSpecialState>;

  /// "COAST", "BRAKE" or the power as a decimal number.
  std::string toString(const MotorState& state);

  class MotorInterface {
  public:
    virtual ~MotorInterface() = default;

    virtual MotorState getMotorState(int identifier) = 0;
    virtual void setMotorState(int identifier, const MotorState& state) = 0;
  };

  class Motor : public Component {
  public:
    Motor(int identifier, MotorInterface& backend) : Component(identifier), backend_(backend) {}

    MotorState power() const { return backend_.getMotorState(identifier()); }

    /// Throws `core::InvalidArgument` for powers outside [-1, 1] (NaN included).
    void setPower(const MotorState& state);

  private:
    MotorInterface& backend_;
  };

} // namespace boardlink::components

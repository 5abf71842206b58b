#pragma once
/** @file  BatterySensor.hpp
 *  @brief Battery voltage/current monitor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "components/Component.hpp"

namespace boardlink::components {

  class BatterySensorInterface {
  public:
    virtual ~BatterySensorInterface() = default;

    virtual double getBatterySensorVoltage(int identifier) = 0; ///< volts
    virtual double getBatterySensorCurrent(int identifier) = 0; ///< amperes
  };

  class BatterySensor : public Component {
  public:
    BatterySensor(int identifier, BatterySensorInterface& backend)
        : Component(identifier), backend_(backend) {}

    double voltage() const { return backend_.getBatterySensorVoltage(identifier()); }
    double current() const { return backend_.getBatterySensorCurrent(identifier()); }

  private:
    BatterySensorInterface& backend_;
  };

} // namespace boardlink::components

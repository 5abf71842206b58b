#pragma once
/** @file  Led.hpp
 *  @brief On/off LED.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "components/Component.hpp"

namespace boardlink::components {

  class LedInterface {
  public:
    virtual ~LedInterface() = default;

    virtual bool getLedState(int identifier) = 0;
    virtual void setLedState(int identifier, bool state) = 0;
  };

  class Led : public Component {
  public:
    Led(int identifier, LedInterface& backend) : Component(identifier), backend_(backend) {}

    bool state() const { return backend_.getLedState(identifier()); }
    void setState(bool state) { backend_.setLedState(identifier(), state); }

  private:
    LedInterface& backend_;
  };

} // namespace boardlink::components

#pragma once
/** @file  Button.hpp
 *  @brief Momentary push button.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "components/Component.hpp"

namespace boardlink::components {

  class ButtonInterface {
  public:
    virtual ~ButtonInterface() = default;

    virtual bool getButtonState(int identifier) = 0;
    /// Blocks until the button reads as pressed.
    virtual void waitUntilButtonPressed(int identifier) = 0;
  };

  class Button : public Component {
  public:
    Button(int identifier, ButtonInterface& backend) : Component(identifier), backend_(backend) {}

    bool isPressed() const { return backend_.getButtonState(identifier()); }
    void waitUntilPressed() { backend_.waitUntilButtonPressed(identifier()); }

  private:
    ButtonInterface& backend_;
  };

} // namespace boardlink::components

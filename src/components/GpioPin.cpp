/* @file GpioPin.cpp
 * @brief GPIO mode checks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <string>
#include <utility>

// boardlink headers
#include "components/GpioPin.hpp"
#include "core/Errors.hpp"

namespace boardlink::components {

  const char* toString(GpioPinMode mode) {
    switch (mode) {
    case GpioPinMode::DigitalInput:
      return "DIGITAL_INPUT";
    case GpioPinMode::DigitalInputPullup:
      return "DIGITAL_INPUT_PULLUP";
    case GpioPinMode::DigitalInputPulldown:
      return "DIGITAL_INPUT_PULLDOWN";
    case GpioPinMode::DigitalOutput:
      return "DIGITAL_OUTPUT";
    case GpioPinMode::AnalogueInput:
      return "ANALOGUE_INPUT";
    case GpioPinMode::AnalogueOutput:
      return "ANALOGUE_OUTPUT";
    case GpioPinMode::PwmOutput:
      return "PWM_OUTPUT";
    }
    return "UNKNOWN";
  }

  GpioPin::GpioPin(int identifier, GpioPinInterface& backend,
                   std::vector<GpioPinMode> supportedModes, std::optional<GpioPinMode> initialMode)
      : Component(identifier), backend_(backend), supportedModes_(std::move(supportedModes)) {
    if (supportedModes_.empty())
      throw core::InvalidArgument("A GPIO pin must support at least one mode.");

    setMode(initialMode.value_or(supportedModes_.front()));
  }

  void GpioPin::setMode(GpioPinMode mode) {
    if (std::find(supportedModes_.begin(), supportedModes_.end(), mode) == supportedModes_.end())
      throw core::NotSupportedByHardware("Pin " + std::to_string(identifier()) +
                                         " does not support " + toString(mode) + ".");
    backend_.setGpioPinMode(identifier(), mode);
  }

  bool GpioPin::digitalState() const {
    const GpioPinMode current = mode();
    requireMode({ GpioPinMode::DigitalOutput, GpioPinMode::DigitalInput,
                  GpioPinMode::DigitalInputPullup, GpioPinMode::DigitalInputPulldown },
                current);

    if (current == GpioPinMode::DigitalOutput)
      return backend_.getGpioPinDigitalState(identifier());
    return backend_.readGpioPinDigitalState(identifier());
  }

  void GpioPin::setDigitalState(bool state) {
    requireMode({ GpioPinMode::DigitalOutput }, mode());
    backend_.writeGpioPinDigitalState(identifier(), state);
  }

  double GpioPin::analogueValue() const {
    requireMode({ GpioPinMode::AnalogueInput }, mode());
    return backend_.readGpioPinAnalogueValue(identifier());
  }

  void GpioPin::requireMode(std::initializer_list<GpioPinMode> modes, GpioPinMode current) const {
    if (std::find(modes.begin(), modes.end(), current) != modes.end())
      return;

    std::string expected;
    for (GpioPinMode m : modes) {
      if (!expected.empty())
        expected += ", ";
      expected += toString(m);
    }
    throw core::BadGpioPinMode("Pin " + std::to_string(identifier()) + " is " + toString(current) +
                               " but needs to be one of: " + expected);
  }

} // namespace boardlink::components

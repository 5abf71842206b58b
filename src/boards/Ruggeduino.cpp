/* @file Ruggeduino.cpp
 * @brief Ruggeduino pin layout and safing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// boardlink headers
#include "boards/Ruggeduino.hpp"
#include "core/Errors.hpp"

namespace boardlink::boards {

  using components::GpioPinMode;

  components::GpioPin& Ruggeduino::pin(int number) {
    if (number >= kFirstDigitalPin && number < kFirstAnaloguePin)
      return digitalPins_.byIdentifier(number);
    if (number >= kFirstAnaloguePin && number <= kLastAnaloguePin)
      return analoguePins_.byIdentifier(number);
    throw core::InvalidArgument("Ruggeduino has no pin " + std::to_string(number));
  }

  void Ruggeduino::makeComponentsSafe(core::SafetyReport& report) {
    for (auto& pin : digitalPins_)
      attempt(report, "GpioPin", pin.identifier(),
              [&] { pin.setMode(GpioPinMode::DigitalInput); });
  }

  std::vector<int> Ruggeduino::pinRange(int first, int last) {
    std::vector<int> ids;
    for (int i = first; i <= last; ++i)
      ids.push_back(i);
    return ids;
  }

  std::vector<GpioPinMode> Ruggeduino::digitalPinModes() {
    return { GpioPinMode::DigitalInput, GpioPinMode::DigitalInputPullup,
             GpioPinMode::DigitalOutput };
  }

  std::vector<GpioPinMode> Ruggeduino::analoguePinModes() {
    return { GpioPinMode::AnalogueInput, GpioPinMode::DigitalInput,
             GpioPinMode::DigitalInputPullup, GpioPinMode::DigitalOutput };
  }

} // namespace boardlink::boards

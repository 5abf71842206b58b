/* @file RuggeduinoConsoleBackend.cpp
 * @brief console Ruggeduino
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// boardlink headers
#include "backends/console/RuggeduinoConsoleBackend.hpp"
#include "core/Errors.hpp"

namespace boardlink::backends {

  using components::GpioPinMode;

  namespace {
    const char* boolText(bool value) { return value ? "true" : "false"; }

    void checkLed(int identifier) {
      if (identifier != 0)
        throw core::InvalidArgument("Ruggeduino only has LED 0 (digital pin 13)");
    }
  } // namespace

  std::vector<std::unique_ptr<boards::Ruggeduino>>
  RuggeduinoConsoleBackend::discover(const Config& config) {
    return discoverEach<RuggeduinoConsoleBackend>(config);
  }

  RuggeduinoConsoleBackend::RuggeduinoConsoleBackend(std::string serial, const Config& config)
      : ConsoleBackend("Ruggeduino", std::move(serial), config) {
    for (int i = boards::Ruggeduino::kFirstDigitalPin; i <= boards::Ruggeduino::kLastAnaloguePin;
         ++i)
      pins_.emplace(i, PinData{});
  }

  RuggeduinoConsoleBackend::PinData& RuggeduinoConsoleBackend::pin(int identifier) {
    auto it = pins_.find(identifier);
    if (it == pins_.end())
      throw core::InvalidArgument("Invalid pin identifier " + std::to_string(identifier) +
                                  "; valid identifiers are 2 - 19");
    return it->second;
  }

  void RuggeduinoConsoleBackend::setGpioPinMode(int identifier, GpioPinMode mode) {
    PinData& data = pin(identifier);
    console().info("Set pin " + std::to_string(identifier) + " to " + components::toString(mode));
    data.mode = mode;
  }

  GpioPinMode RuggeduinoConsoleBackend::getGpioPinMode(int identifier) {
    return pin(identifier).mode;
  }

  void RuggeduinoConsoleBackend::writeGpioPinDigitalState(int identifier, bool state) {
    PinData& data = pin(identifier);
    if (data.mode != GpioPinMode::DigitalOutput)
      throw core::BadGpioPinMode("Pin " + std::to_string(identifier) +
                                 " mode needs to be DIGITAL_OUTPUT in order to set the digital "
                                 "state.");
    console().info("Set pin " + std::to_string(identifier) + " state to " + boolText(state));
    data.digitalState = state;
  }

  bool RuggeduinoConsoleBackend::getGpioPinDigitalState(int identifier) {
    PinData& data = pin(identifier);
    if (data.mode != GpioPinMode::DigitalOutput)
      throw core::BadGpioPinMode("Pin " + std::to_string(identifier) +
                                 " mode needs to be DIGITAL_OUTPUT in order to read the digital "
                                 "state.");
    return data.digitalState;
  }

  bool RuggeduinoConsoleBackend::readGpioPinDigitalState(int identifier) {
    PinData& data = pin(identifier);
    if (data.mode != GpioPinMode::DigitalInput && data.mode != GpioPinMode::DigitalInputPullup &&
        data.mode != GpioPinMode::DigitalInputPulldown)
      throw core::BadGpioPinMode("Pin " + std::to_string(identifier) +
                                 " mode needs to be DIGITAL_INPUT_* in order to read the "
                                 "digital state.");
    return console().read<bool>("Pin " + std::to_string(identifier) +
                                " digital state [true/false]");
  }

  double RuggeduinoConsoleBackend::readGpioPinAnalogueValue(int identifier) {
    PinData& data = pin(identifier);
    if (data.mode != GpioPinMode::AnalogueInput)
      throw core::BadGpioPinMode("Pin " + std::to_string(identifier) +
                                 " mode needs to be ANALOGUE_INPUT in order to read the "
                                 "analogue value.");
    return console().read<double>("Pin " + std::to_string(identifier) + " ADC state [float]");
  }

  bool RuggeduinoConsoleBackend::getLedState(int identifier) {
    checkLed(identifier);
    return getGpioPinDigitalState(kLedPin);
  }

  void RuggeduinoConsoleBackend::setLedState(int identifier, bool state) {
    checkLed(identifier);
    writeGpioPinDigitalState(kLedPin, state);
  }

  std::string RuggeduinoConsoleBackend::executeStringCommand(const std::string& command) {
    return console().read<std::string>("Response to string command \"" + command + "\" [str]");
  }

} // namespace boardlink::backends

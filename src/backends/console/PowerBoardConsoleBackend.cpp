/* @file PowerBoardConsoleBackend.cpp
 * @brief console power board
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>
#include <thread>

// boardlink headers
#include "backends/console/PowerBoardConsoleBackend.hpp"
#include "core/Errors.hpp"

namespace boardlink::backends {

  namespace {
    constexpr long kMaxPiezoDurationMs = 65535;

    void checkOnly(const char* what, int identifier) {
      if (identifier != 0)
        throw core::InvalidArgument(std::string("invalid ") + what + " identifier " +
                                    std::to_string(identifier) +
                                    "; the only valid identifier is 0");
    }

    void checkOutput(int identifier) {
      if (identifier < 0 || identifier > 6)
        throw core::InvalidArgument("Invalid power output identifier " +
                                    std::to_string(identifier) +
                                    "; valid identifiers are 0 - 6");
    }

    void checkLed(int identifier) {
      if (identifier < 0 || identifier > 1)
        throw core::InvalidArgument("invalid LED identifier " + std::to_string(identifier) +
                                    "; valid identifiers are 0 (run LED) and 1 (error LED)");
    }

    const char* boolText(bool value) { return value ? "true" : "false"; }
  } // namespace

  std::vector<std::unique_ptr<boards::PowerBoard>>
  PowerBoardConsoleBackend::discover(const Config& config) {
    return discoverEach<PowerBoardConsoleBackend>(config, kFeatures);
  }

  bool PowerBoardConsoleBackend::getPowerOutputEnabled(int identifier) {
    checkOutput(identifier);
    return outputs_[identifier];
  }

  void PowerBoardConsoleBackend::setPowerOutputEnabled(int identifier, bool enabled) {
    checkOutput(identifier);
    console().info("Setting output " + std::to_string(identifier) + " to " + boolText(enabled));
    outputs_[identifier] = enabled;
  }

  double PowerBoardConsoleBackend::getPowerOutputCurrent(int identifier) {
    checkOutput(identifier);
    return console().read<double>("Current for power output " + std::to_string(identifier) +
                                  " [amps]");
  }

  void PowerBoardConsoleBackend::buzz(int identifier, std::chrono::milliseconds duration,
                                      double frequencyHz, bool blocking) {
    checkOnly("piezo", identifier);
    if (duration.count() > kMaxPiezoDurationMs)
      throw core::InvalidArgument("Maximum piezo duration is 65535ms.");

    std::ostringstream text;
    text << "Buzzing at " << frequencyHz << "Hz for " << duration.count() << "ms";
    console().info(text.str());

    if (blocking)
      std::this_thread::sleep_for(duration);
  }

  bool PowerBoardConsoleBackend::getButtonState(int identifier) {
    checkOnly("button", identifier);
    return console().read<bool>("Start button state [true/false]");
  }

  void PowerBoardConsoleBackend::waitUntilButtonPressed(int identifier) {
    checkOnly("button", identifier);
    console().info("Waiting for start button press.");
    console().wait("Hit return to press start button");
  }

  double PowerBoardConsoleBackend::getBatterySensorVoltage(int identifier) {
    checkOnly("battery sensor", identifier);
    return console().read<double>("Battery voltage [volts]");
  }

  double PowerBoardConsoleBackend::getBatterySensorCurrent(int identifier) {
    checkOnly("battery sensor", identifier);
    return console().read<double>("Battery current [amps]");
  }

  bool PowerBoardConsoleBackend::getLedState(int identifier) {
    checkLed(identifier);
    return leds_[identifier];
  }

  void PowerBoardConsoleBackend::setLedState(int identifier, bool state) {
    checkLed(identifier);
    console().info("Set LED " + std::to_string(identifier) + " to " + boolText(state));
    leds_[identifier] = state;
  }

} // namespace boardlink::backends

/* @file RuggeduinoHardwareBackend.cpp
 * @brief Ruggeduino ASCII protocol
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <charconv>
#include <system_error>

// boardlink headers
#include "backends/hardware/RuggeduinoHardwareBackend.hpp"
#include "protocols/Response.hpp"

namespace boardlink::backends {

  using components::GpioPinMode;

  namespace {
    constexpr char kOpVersion = 'v';
    constexpr char kOpInput = 'i';
    constexpr char kOpInputPullup = 'p';
    constexpr char kOpOutput = 'o';
    constexpr char kOpHigh = 'h';
    constexpr char kOpLow = 'l';
    constexpr char kOpRead = 'r';
    constexpr char kOpAnalogue = 'a';

    bool isDigitalInput(GpioPinMode mode) {
      return mode == GpioPinMode::DigitalInput || mode == GpioPinMode::DigitalInputPullup ||
             mode == GpioPinMode::DigitalInputPulldown;
    }

    void checkLed(int identifier) {
      if (identifier != 0)
        throw core::InvalidArgument("Ruggeduino only has LED 0 (digital pin 13)");
    }
  } // namespace

  bool RuggeduinoHardwareBackend::isArduinoUno(const io::SerialPortInfo& port) {
    if (!port.vid || !port.pid)
      return false;
    return std::find(kUsbIds.begin(), kUsbIds.end(), std::make_pair(*port.vid, *port.pid)) !=
           kUsbIds.end();
  }

  std::vector<std::unique_ptr<boards::Ruggeduino>>
  RuggeduinoHardwareBackend::discover(const Config& config) {
    return discoverPorts<RuggeduinoHardwareBackend>(config, kBaud, &isArduinoUno);
  }

  RuggeduinoHardwareBackend::RuggeduinoHardwareBackend(std::unique_ptr<io::SerialChannel> channel,
                                                       const io::SerialPortInfo& port,
                                                       const Config& config)
      : SerialHardwareBackend(std::move(channel), port, config) {
    std::lock_guard<std::mutex> lk(mutex());

    // the board resets when the port opens and stays silent until it has booted
    std::string line = execute({ kOpVersion, std::nullopt });
    for (int attempt = 0; line.empty(); ++attempt) {
      if (attempt >= kMaxEmptyVersionReplies)
        throw core::CommunicationError("Ruggeduino (" + device() +
                                       ") is not responding or runs custom firmware.");
      line = execute({ kOpVersion, std::nullopt });
    }

    if (auto response = protocols::VersionResponse::fromWire(line)) {
      model_ = response->model;
      version_ = response->version;
    } else {
      version_ = line;
    }
    if (version_ != kSupportedFirmware)
      throw core::UnsupportedFirmware("Unexpected firmware version: " + version_ +
                                      ", expected \"1\".");

    for (int i = boards::Ruggeduino::kFirstDigitalPin; i < boards::Ruggeduino::kFirstAnaloguePin;
         ++i)
      pins_.emplace(i, PinData{ GpioPinMode::DigitalInput });
    for (int i = boards::Ruggeduino::kFirstAnaloguePin; i <= boards::Ruggeduino::kLastAnaloguePin;
         ++i)
      pins_.emplace(i, PinData{ GpioPinMode::AnalogueInput });

    logger().info(kName, "opened " + device() + " (" + line + ")");
  }

  std::optional<std::string> RuggeduinoHardwareBackend::firmwareVersion() { return version_; }

  void RuggeduinoHardwareBackend::setGpioPinMode(int identifier, GpioPinMode mode) {
    std::lock_guard<std::mutex> lk(mutex());
    PinData& data = pin(identifier);

    switch (mode) {
    case GpioPinMode::DigitalInput:
      execute({ kOpInput, identifier });
      break;
    case GpioPinMode::DigitalInputPullup:
      execute({ kOpInputPullup, identifier });
      break;
    case GpioPinMode::DigitalOutput:
      execute({ kOpOutput, identifier });
      execute({ data.digitalState ? kOpHigh : kOpLow, identifier });
      break;
    case GpioPinMode::AnalogueInput:
      if (identifier < boards::Ruggeduino::kFirstAnaloguePin)
        throw core::NotSupportedByHardware("Pin " + std::to_string(identifier) +
                                           " is not an analogue input.");
      break;
    default:
      throw core::NotSupportedByHardware(std::string("Ruggeduino does not support ") +
                                         components::toString(mode) + ".");
    }
    data.mode = mode;
  }

  GpioPinMode RuggeduinoHardwareBackend::getGpioPinMode(int identifier) {
    std::lock_guard<std::mutex> lk(mutex());
    return pin(identifier).mode;
  }

  void RuggeduinoHardwareBackend::writeGpioPinDigitalState(int identifier, bool state) {
    std::lock_guard<std::mutex> lk(mutex());
    writeDigital(identifier, state);
  }

  bool RuggeduinoHardwareBackend::getGpioPinDigitalState(int identifier) {
    std::lock_guard<std::mutex> lk(mutex());
    PinData& data = pin(identifier);
    if (data.mode != GpioPinMode::DigitalOutput)
      throw core::BadGpioPinMode("Pin " + std::to_string(identifier) +
                                 " mode needs to be DIGITAL_OUTPUT in order to read the last "
                                 "written state.");
    return data.digitalState;
  }

  bool RuggeduinoHardwareBackend::readGpioPinDigitalState(int identifier) {
    std::lock_guard<std::mutex> lk(mutex());
    if (!isDigitalInput(pin(identifier).mode))
      throw core::BadGpioPinMode("Pin " + std::to_string(identifier) +
                                 " mode needs to be DIGITAL_INPUT_* in order to read the "
                                 "digital state.");

    std::string reply = execute({ kOpRead, identifier });
    if (reply == "h")
      return true;
    if (reply == "l")
      return false;
    throw core::CommunicationError("Invalid response from Ruggeduino: '" + reply + "'");
  }

  double RuggeduinoHardwareBackend::readGpioPinAnalogueValue(int identifier) {
    std::lock_guard<std::mutex> lk(mutex());
    if (pin(identifier).mode != GpioPinMode::AnalogueInput)
      throw core::BadGpioPinMode("Pin " + std::to_string(identifier) +
                                 " mode needs to be ANALOGUE_INPUT in order to read the "
                                 "analogue value.");

    std::string reply = execute({ kOpAnalogue, identifier - boards::Ruggeduino::kFirstAnaloguePin });
    int steps = -1;
    const char* end = reply.data() + reply.size();
    auto [ptr, ec] = std::from_chars(reply.data(), end, steps);
    if (ec != std::errc() || ptr != end || steps < 0 || steps >= static_cast<int>(kAdcSteps))
      throw core::CommunicationError("Invalid response from Ruggeduino: '" + reply + "'");
    return steps / kAdcSteps * kAnalogueReference;
  }

  bool RuggeduinoHardwareBackend::getLedState(int identifier) {
    checkLed(identifier);
    return getGpioPinDigitalState(kLedPin);
  }

  void RuggeduinoHardwareBackend::setLedState(int identifier, bool state) {
    checkLed(identifier);
    writeGpioPinDigitalState(kLedPin, state);
  }

  std::string RuggeduinoHardwareBackend::executeStringCommand(const std::string& command) {
    if (isOfficialFirmware())
      throw core::NotSupportedByHardware(
          "Ruggeduino should run custom firmware for command support");
    std::lock_guard<std::mutex> lk(mutex());
    return executeRaw(command);
  }

  std::string RuggeduinoHardwareBackend::execute(const protocols::Command& command) {
    return executeRaw(command.toWire());
  }

  std::string RuggeduinoHardwareBackend::executeRaw(const std::string& wire) {
    send(wire);
    return tryReadLine().value_or("");
  }

  RuggeduinoHardwareBackend::PinData& RuggeduinoHardwareBackend::pin(int identifier) {
    auto it = pins_.find(identifier);
    if (it == pins_.end())
      throw core::InvalidArgument("Invalid pin identifier " + std::to_string(identifier) +
                                  "; valid identifiers are 2 - 19");
    return it->second;
  }

  void RuggeduinoHardwareBackend::writeDigital(int identifier, bool state) {
    PinData& data = pin(identifier);
    if (data.mode != GpioPinMode::DigitalOutput)
      throw core::BadGpioPinMode("Pin " + std::to_string(identifier) +
                                 " mode needs to be DIGITAL_OUTPUT in order to set the digital "
                                 "state.");
    execute({ state ? kOpHigh : kOpLow, identifier });
    data.digitalState = state;
  }

} // namespace boardlink::backends

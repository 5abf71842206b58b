/* @file PowerBoardSerialHardwareBackend.cpp
 * @brief SR v4 power board serial protocol (4.x firmware)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <cmath>
#include <system_error>
#include <thread>

// boardlink headers
#include "backends/hardware/PowerBoardSerialHardwareBackend.hpp"

namespace boardlink::backends {

  namespace {
    constexpr long kMaxPiezoValue = 65535;
    constexpr const char* kLedNames[] = { "RUN", "ERR" };

    void checkOutput(int identifier) {
      if (identifier < 0 || identifier >= PowerBoardSerialHardwareBackend::kOutputCount)
        throw core::InvalidArgument("Invalid power output identifier " +
                                    std::to_string(identifier) +
                                    "; valid identifiers are 0 - 5");
    }

    void checkOnly(const char* what, int identifier) {
      if (identifier != 0)
        throw core::InvalidArgument(std::string("Invalid ") + what + " identifier " +
                                    std::to_string(identifier) +
                                    "; the only valid identifier is 0.");
    }

    void checkLed(int identifier) {
      if (identifier < 0 || identifier > 1)
        throw core::InvalidArgument("Invalid LED identifier " + std::to_string(identifier) +
                                    "; valid identifiers are 0 (run LED) and 1 (error LED).");
    }
  } // namespace

  bool PowerBoardSerialHardwareBackend::isPowerBoard(const io::SerialPortInfo& port) {
    return port.vid == kVendorId && port.pid == kProductId &&
           port.manufacturer == kManufacturer && port.product == kProduct;
  }

  std::vector<std::unique_ptr<boards::PowerBoard>>
  PowerBoardSerialHardwareBackend::discover(const Config& config) {
    return discoverPorts<PowerBoardSerialHardwareBackend>(config, kBaud, &isPowerBoard);
  }

  PowerBoardSerialHardwareBackend::PowerBoardSerialHardwareBackend(
      std::unique_ptr<io::SerialChannel> channel, const io::SerialPortInfo& port,
      const Config& config)
      : SerialHardwareBackend(std::move(channel), port, config) {
    if (port.serialNumber.empty())
      throw core::CommunicationError("Found power board-like device on " + port.device +
                                     " without serial number. The power board is likely to "
                                     "be damaged.");

    std::lock_guard<std::mutex> lk(mutex());

    std::string version = queryIdentity().softwareVersion;
    if (version.rfind(kSupportedFirmwarePrefix, 0) != 0)
      throw core::UnsupportedFirmware("This power board is running firmware version " + version +
                                      ", but only version 4.x is supported.");
    request("*RESET");
    logger().info(kName, "opened " + device() + " (" + port.serialNumber + ")");
  }

  std::optional<std::string> PowerBoardSerialHardwareBackend::firmwareVersion() {
    std::lock_guard<std::mutex> lk(mutex());
    return queryIdentity().softwareVersion;
  }

  protocols::IdentityResponse PowerBoardSerialHardwareBackend::identity() {
    std::lock_guard<std::mutex> lk(mutex());
    return queryIdentity();
  }

  bool PowerBoardSerialHardwareBackend::getPowerOutputEnabled(int identifier) {
    checkOutput(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    std::string reply = query("OUT:" + std::to_string(identifier) + ":GET?");
    if (reply == "0")
      return false;
    if (reply == "1")
      return true;
    throw core::CommunicationError("Invalid response received: " + reply);
  }

  void PowerBoardSerialHardwareBackend::setPowerOutputEnabled(int identifier, bool enabled) {
    checkOutput(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    request("OUT:" + std::to_string(identifier) + ":SET:" + (enabled ? "1" : "0"));
  }

  double PowerBoardSerialHardwareBackend::getPowerOutputCurrent(int identifier) {
    checkOutput(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return queryDouble("OUT:" + std::to_string(identifier) + ":I?");
  }

  void PowerBoardSerialHardwareBackend::buzz(int identifier, std::chrono::milliseconds duration,
                                             double frequencyHz, bool blocking) {
    checkOnly("piezo", identifier);
    if (duration.count() > kMaxPiezoValue)
      throw core::NotSupportedByHardware("Maximum piezo duration is 65535ms.");
    long frequency = std::lround(frequencyHz);
    if (frequency > kMaxPiezoValue)
      throw core::NotSupportedByHardware("Maximum piezo frequency is 65535Hz.");

    {
      std::lock_guard<std::mutex> lk(mutex());
      request("NOTE:" + std::to_string(frequency) + ":" + std::to_string(duration.count()));
    }

    if (blocking)
      std::this_thread::sleep_for(duration);
  }

  bool PowerBoardSerialHardwareBackend::getButtonState(int identifier) {
    checkOnly("button", identifier);
    std::lock_guard<std::mutex> lk(mutex());
    std::string reply = query("BTN:START:GET?");

    // <internal>:<external>, either one pressed counts
    auto colon = reply.find(':');
    if (colon != std::string::npos) {
      std::string internal = reply.substr(0, colon);
      std::string external = reply.substr(colon + 1);
      if (internal == "1" || external == "1")
        return true;
      if (internal == "0" || external == "0")
        return false;
    }
    throw core::CommunicationError("Invalid response received: " + reply);
  }

  void PowerBoardSerialHardwareBackend::waitUntilButtonPressed(int identifier) {
    while (!getButtonState(identifier))
      std::this_thread::sleep_for(kButtonPollInterval);
  }

  double PowerBoardSerialHardwareBackend::getBatterySensorVoltage(int identifier) {
    checkOnly("battery sensor", identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return queryDouble("BATT:V?");
  }

  double PowerBoardSerialHardwareBackend::getBatterySensorCurrent(int identifier) {
    checkOnly("battery sensor", identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return queryDouble("BATT:I?");
  }

  bool PowerBoardSerialHardwareBackend::getLedState(int identifier) {
    checkLed(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return leds_[identifier];
  }

  void PowerBoardSerialHardwareBackend::setLedState(int identifier, bool state) {
    checkLed(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    request(std::string("LED:") + kLedNames[identifier] + ":SET:" + (state ? "1" : "0"));
    leds_[identifier] = state;
  }

  //---protocol----------------------------------------------------------------

  std::string PowerBoardSerialHardwareBackend::rawRequest(const std::string& command) {
    send(command + "\n");
    std::string reply = readLine();
    if (reply.rfind("NACK", 0) == 0) {
      auto colon = reply.find(':');
      throw core::CommunicationError("Power Board returned an error: " +
                                     (colon == std::string::npos ? reply
                                                                 : reply.substr(colon + 1)));
    }
    return reply;
  }

  void PowerBoardSerialHardwareBackend::request(const std::string& command) {
    std::string reply = rawRequest(command);
    if (reply != "ACK")
      throw core::CommunicationError("Expected ACK from Power Board, but got: " + reply);
  }

  std::string PowerBoardSerialHardwareBackend::query(const std::string& command) {
    std::string reply = rawRequest(command);
    if (reply.empty() || reply == "ACK")
      throw core::CommunicationError("Power board responded with ACK but expected data.");
    return reply;
  }

  double PowerBoardSerialHardwareBackend::queryDouble(const std::string& command) {
    std::string reply = query(command);
    double value = 0.0;
    const char* end = reply.data() + reply.size();
    auto [ptr, ec] = std::from_chars(reply.data(), end, value);
    if (ec != std::errc() || ptr != end)
      throw core::CommunicationError("Power board returned " + reply + ", but expected a float");
    return value;
  }

  protocols::IdentityResponse PowerBoardSerialHardwareBackend::queryIdentity() {
    std::string reply = query("*IDN?");
    auto identity = protocols::IdentityResponse::fromWire(reply);
    if (!identity)
      throw core::CommunicationError("Identify response did not match format: " + reply);
    return *identity;
  }

} // namespace boardlink::backends

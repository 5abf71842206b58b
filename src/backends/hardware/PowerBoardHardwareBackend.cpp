/* @file PowerBoardHardwareBackend.cpp
 * @brief SR v4 power board USB protocol (legacy firmware)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cmath>
#include <thread>
#include <utility>

// boardlink headers
#include "backends/hardware/PowerBoardHardwareBackend.hpp"
#include "backends/hardware/PowerBoardSerialHardwareBackend.hpp"

namespace boardlink::backends {

  namespace {
    constexpr long kMaxPiezoValue = 65535;

    void checkOutput(int identifier) {
      if (identifier < 0 || identifier >= PowerBoardHardwareBackend::kOutputCount)
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

  std::vector<std::unique_ptr<boards::PowerBoard>>
  PowerBoardHardwareBackend::discover(const Config& config) {
    auto boards = discoverDevices<PowerBoardHardwareBackend>(config.usb, kVendorId, kProductId,
                                                             &isLegacyFirmware);
    for (auto& board : PowerBoardSerialHardwareBackend::discover(config.serial))
      boards.push_back(std::move(board));
    return boards;
  }

  PowerBoardHardwareBackend::PowerBoardHardwareBackend(std::unique_ptr<io::UsbDevice> handle,
                                                       const UsbConfig& config)
      : UsbHardwareBackend(std::move(handle), config) {
    std::lock_guard<std::mutex> lk(mutex());

    std::string version = readFirmwareVersion();
    if (version != kSupportedFirmware)
      throw core::UnsupportedFirmware("This power board is running firmware version " + version +
                                      ", but only version 3 is supported.");
    logger().info(kName, "opened " + device().info().devicePath + " (" + serialNumber() + ")");
  }

  std::optional<std::string> PowerBoardHardwareBackend::firmwareVersion() {
    std::lock_guard<std::mutex> lk(mutex());
    return readFirmwareVersion();
  }

  bool PowerBoardHardwareBackend::getPowerOutputEnabled(int identifier) {
    checkOutput(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return outputs_[identifier];
  }

  void PowerBoardHardwareBackend::setPowerOutputEnabled(int identifier, bool enabled) {
    checkOutput(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    write(protocols::WriteCommand{ static_cast<std::uint16_t>(identifier) },
          static_cast<std::uint16_t>(enabled));
    outputs_[identifier] = enabled;
  }

  double PowerBoardHardwareBackend::getPowerOutputCurrent(int identifier) {
    checkOutput(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    auto data = read(protocols::ReadCommand{ static_cast<std::uint16_t>(identifier), 4 });
    return protocols::readU32LE(data) / 1000.0; // mA -> A
  }

  void PowerBoardHardwareBackend::buzz(int identifier, std::chrono::milliseconds duration,
                                       double frequencyHz, bool blocking) {
    checkOnly("piezo", identifier);
    if (duration.count() > kMaxPiezoValue)
      throw core::NotSupportedByHardware("Maximum piezo duration is 65535ms.");
    long frequency = std::lround(frequencyHz);
    if (frequency > kMaxPiezoValue)
      throw core::NotSupportedByHardware("Maximum piezo frequency is 65535Hz.");

    std::vector<std::uint8_t> data;
    protocols::appendU16LE(data, static_cast<std::uint16_t>(frequency));
    protocols::appendU16LE(data, static_cast<std::uint16_t>(duration.count()));

    {
      std::lock_guard<std::mutex> lk(mutex());
      try {
        write(kCmdWritePiezo, data);
      } catch (const core::TransportFailure& e) {
        if (e.errorNumber() == EPIPE)
          throw core::CommunicationError(std::string(e.what()) +
                                         "; are you sending buzz commands to the power board "
                                         "too quickly");
        throw;
      }
    }

    if (blocking)
      std::this_thread::sleep_for(duration);
  }

  bool PowerBoardHardwareBackend::getButtonState(int identifier) {
    checkOnly("button", identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return protocols::readU32LE(read(kCmdReadButton)) != 0;
  }

  void PowerBoardHardwareBackend::waitUntilButtonPressed(int identifier) {
    while (!getButtonState(identifier))
      std::this_thread::sleep_for(kButtonPollInterval);
  }

  double PowerBoardHardwareBackend::getBatterySensorVoltage(int identifier) {
    checkOnly("battery sensor", identifier);
    std::lock_guard<std::mutex> lk(mutex());
    auto data = read(kCmdReadBattery);
    return protocols::readU32LE(data, 4) / 1000.0; // mV -> V
  }

  double PowerBoardHardwareBackend::getBatterySensorCurrent(int identifier) {
    checkOnly("battery sensor", identifier);
    std::lock_guard<std::mutex> lk(mutex());
    auto data = read(kCmdReadBattery);
    return protocols::readU32LE(data, 0) / 1000.0; // mA -> A
  }

  bool PowerBoardHardwareBackend::getLedState(int identifier) {
    checkLed(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return leds_[identifier];
  }

  void PowerBoardHardwareBackend::setLedState(int identifier, bool state) {
    checkLed(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    write(identifier == 0 ? kCmdWriteRunLed : kCmdWriteErrorLed, static_cast<std::uint16_t>(state));
    leds_[identifier] = state;
  }

  std::string PowerBoardHardwareBackend::readFirmwareVersion() {
    return std::to_string(protocols::readU32LE(read(kCmdReadFirmware)));
  }

} // namespace boardlink::backends

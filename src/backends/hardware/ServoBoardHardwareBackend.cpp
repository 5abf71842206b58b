/* @file ServoBoardHardwareBackend.cpp
 * @brief SR v4 servo board USB protocol
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cmath>

// boardlink headers
#include "backends/hardware/ServoBoardHardwareBackend.hpp"

namespace boardlink::backends {

  namespace {
    void checkServo(int identifier) {
      if (identifier < 0 || identifier >= boards::ServoBoard::kServoCount)
        throw core::InvalidArgument("Only integers 0 - 11 are valid servo identifiers.");
    }
  } // namespace

  std::vector<std::unique_ptr<boards::ServoBoard>>
  ServoBoardHardwareBackend::discover(const Config& config) {
    return discoverDevices<ServoBoardHardwareBackend>(config, kVendorId, kProductId,
                                                      [](const io::UsbDeviceInfo&) { return true; });
  }

  ServoBoardHardwareBackend::ServoBoardHardwareBackend(std::unique_ptr<io::UsbDevice> handle,
                                                       const Config& config)
      : UsbHardwareBackend(std::move(handle), config) {
    std::lock_guard<std::mutex> lk(mutex());

    std::string version = readFirmwareVersion();
    if (version != kSupportedFirmware)
      throw core::UnsupportedFirmware("Servo Board (" + serialNumber() +
                                      ") is running firmware version " + version +
                                      ", but only version 2 is supported");

    write(kCmdWriteInit, std::vector<std::uint8_t>{});
    for (int i = 0; i < boards::ServoBoard::kServoCount; ++i)
      writeServo(i, 0.0);
    logger().info(kName, "opened " + device().info().devicePath + " (" + serialNumber() + ")");
  }

  std::optional<std::string> ServoBoardHardwareBackend::firmwareVersion() {
    std::lock_guard<std::mutex> lk(mutex());
    return readFirmwareVersion();
  }

  components::ServoPosition ServoBoardHardwareBackend::getServoPosition(int identifier) {
    checkServo(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return positions_[identifier];
  }

  void ServoBoardHardwareBackend::setServoPosition(int identifier,
                                                   components::ServoPosition position) {
    checkServo(identifier);
    if (!position)
      throw core::NotSupportedByHardware(std::string(boards::ServoBoard::kName) +
                                         " does not support unpowered servos.");
    if (!(*position >= -1.0 && *position <= 1.0))
      throw core::InvalidArgument("Only numbers between -1 and 1 are valid servo positions.");

    std::lock_guard<std::mutex> lk(mutex());
    writeServo(identifier, *position);
  }

  std::string ServoBoardHardwareBackend::readFirmwareVersion() {
    try {
      return std::to_string(protocols::readU32LE(read(kCmdReadFirmware)));
    } catch (const core::TransportFailure& e) {
      if (e.errorNumber() == EIO)
        throw core::TransportFailure(std::string(e.what()) +
                                         "; are you sure the servo board is being correctly "
                                         "powered?",
                                     e.errorNumber());
      throw;
    } catch (const core::TransportTimeout& e) {
      throw core::TransportTimeout(std::string(e.what()) +
                                   "; are you sure the servo board is being correctly powered?");
    }
  }

  void ServoBoardHardwareBackend::writeServo(int identifier, double position) {
    // wValue carries the signed value in two's complement
    auto value = static_cast<std::int16_t>(std::lround(position * 100));
    write(protocols::WriteCommand{ static_cast<std::uint16_t>(identifier) },
          static_cast<std::uint16_t>(value));
    positions_[identifier] = position;
  }

} // namespace boardlink::backends

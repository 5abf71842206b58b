/* @file MotorBoardHardwareBackend.cpp
 * @brief MCV4B serial protocol
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <exception>

// boardlink headers
#include "backends/hardware/MotorBoardHardwareBackend.hpp"
#include "protocols/Response.hpp"

namespace boardlink::backends {

  namespace {
    void checkMotor(int identifier) {
      if (identifier < 0 || identifier > 1)
        throw core::InvalidArgument("Invalid motor identifier: " + std::to_string(identifier) +
                                    ", valid values are: 0, 1");
    }
  } // namespace

  bool MotorBoardHardwareBackend::isMotorBoard(const io::SerialPortInfo& port) {
    return port.vid == kVendorId && port.pid == kProductId &&
           port.manufacturer == kManufacturer && port.product == kProduct;
  }

  std::vector<std::unique_ptr<boards::MotorBoard>>
  MotorBoardHardwareBackend::discover(const Config& config) {
    return discoverPorts<MotorBoardHardwareBackend>(config, kBaud, &isMotorBoard);
  }

  MotorBoardHardwareBackend::MotorBoardHardwareBackend(std::unique_ptr<io::SerialChannel> channel,
                                                       const io::SerialPortInfo& port,
                                                       const Config& config)
      : SerialHardwareBackend(std::move(channel), port, config) {
    std::lock_guard<std::mutex> lk(mutex());

    std::string version = queryVersion();
    if (version != kSupportedFirmware)
      throw core::UnsupportedFirmware("Unexpected firmware version: " + version +
                                      ", expected: \"3\".");

    for (int i = 0; i < static_cast<int>(states_.size()); ++i)
      writeMotor(i, states_[i]);
    logger().info(kName, "opened " + device() + " (" + port.serialNumber + ")");
  }

  MotorBoardHardwareBackend::~MotorBoardHardwareBackend() {
    try {
      std::lock_guard<std::mutex> lk(mutex());
      for (int i = 0; i < static_cast<int>(states_.size()); ++i)
        writeMotor(i, components::MotorSpecialState::Brake);
      drain();
    } catch (const std::exception& e) {
      logger().error(kName, "failed to brake motors on close of " + device() + ": " + e.what());
    }
  }

  std::optional<std::string> MotorBoardHardwareBackend::firmwareVersion() {
    std::lock_guard<std::mutex> lk(mutex());
    return queryVersion();
  }

  components::MotorState MotorBoardHardwareBackend::getMotorState(int identifier) {
    checkMotor(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    return states_[identifier];
  }

  void MotorBoardHardwareBackend::setMotorState(int identifier,
                                                const components::MotorState& state) {
    checkMotor(identifier);
    std::lock_guard<std::mutex> lk(mutex());
    writeMotor(identifier, state);
  }

  std::uint8_t MotorBoardHardwareBackend::encode(const components::MotorState& state) {
    if (const auto* special = std::get_if<components::MotorSpecialState>(&state))
      return *special == components::MotorSpecialState::Brake ? kSpeedBrake : kSpeedCoast;

    double power = std::get<double>(state);
    if (!(power >= -1.0 && power <= 1.0))
      throw core::InvalidArgument("Only motor powers between -1 and 1 are supported.");
    // -125..125 keeps both directions symmetric around the special values
    return static_cast<std::uint8_t>(std::lround(power * 125) + 128);
  }

  std::string MotorBoardHardwareBackend::queryVersion() {
    send(std::string(1, static_cast<char>(kCmdVersion)));
    std::string line = readLine();
    auto response = protocols::VersionResponse::fromWire(line);
    if (!response || response->model != kProduct)
      throw core::CommunicationError("Unexpected model string: " + line + ", expected MCV4B.");
    return response->version;
  }

  void MotorBoardHardwareBackend::writeMotor(int identifier, const components::MotorState& state) {
    send(std::string{ static_cast<char>(kCmdMotor[identifier]),
                      static_cast<char>(encode(state)) });
    states_[identifier] = state;
  }

} // namespace boardlink::backends

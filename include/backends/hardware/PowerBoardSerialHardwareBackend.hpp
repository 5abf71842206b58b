#pragma once
/** @file  PowerBoardSerialHardwareBackend.hpp
 *  @brief Serial backend for the SR v4 power board running current (4.x) firmware.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// boardlink headers
#include "backends/hardware/SerialHardwareBackend.hpp"
#include "boards/PowerBoard.hpp"
#include "protocols/Response.hpp"

namespace boardlink::backends {

  /**
 * @class PowerBoardSerialHardwareBackend
 * @brief Line based ASCII protocol, one command per line:
 *
 *  * requests (`*RESET`, `OUT:2:SET:1`, ...) are answered with `ACK`;
 *  * queries end in `?` and are answered with data;
 *  * any command may be answered with `NACK:<reason>`.
 *
 *  The board is reset on open; LED states are not readable and are cached.
 */
  class PowerBoardSerialHardwareBackend : public SerialHardwareBackend,
                                          public components::PowerOutputInterface,
                                          public components::PiezoInterface,
                                          public components::ButtonInterface,
                                          public components::BatterySensorInterface,
                                          public components::LedInterface {
  public:
    using BoardType = boards::PowerBoard;
    using Config = SerialConfig;

    static constexpr const char* kName = "PowerBoardSerialHardwareBackend";

    static constexpr std::uint16_t kVendorId = 0x1bda;
    static constexpr std::uint16_t kProductId = 0x0010;
    static constexpr const char* kManufacturer = "Student Robotics";
    static constexpr const char* kProduct = "PBV4B";
    static constexpr unsigned int kBaud = 115200;
    static constexpr const char* kSupportedFirmwarePrefix = "4.";
    static constexpr int kOutputCount = 6;

    static constexpr std::chrono::milliseconds kButtonPollInterval{ 50 };

    static bool isPowerBoard(const io::SerialPortInfo& port);

    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    /// @throws core::UnsupportedFirmware unless the board reports 4.x firmware.
    PowerBoardSerialHardwareBackend(std::unique_ptr<io::SerialChannel> channel,
                                    const io::SerialPortInfo& port, const Config& config);

    std::optional<std::string> firmwareVersion() override;

    /// Vendor, board, asset tag and firmware version as reported by `*IDN?`.
    protocols::IdentityResponse identity();

    bool getPowerOutputEnabled(int identifier) override;
    void setPowerOutputEnabled(int identifier, bool enabled) override;
    double getPowerOutputCurrent(int identifier) override;

    /// @throws core::NotSupportedByHardware above 65535 ms or 65535 Hz.
    void buzz(int identifier, std::chrono::milliseconds duration, double frequencyHz,
              bool blocking) override;

    bool getButtonState(int identifier) override;
    void waitUntilButtonPressed(int identifier) override;

    double getBatterySensorVoltage(int identifier) override;
    double getBatterySensorCurrent(int identifier) override;

    bool getLedState(int identifier) override;
    void setLedState(int identifier, bool state) override;

  private:
    /// Sends \p command and returns the reply. @throws core::CommunicationError on NACK.
    std::string rawRequest(const std::string& command);
    /// A command answered with ACK.
    void request(const std::string& command);
    /// A `?` command answered with data.
    std::string query(const std::string& command);
    double queryDouble(const std::string& command);

    protocols::IdentityResponse queryIdentity();

    std::array<bool, 2> leds_{};
  };

} // namespace boardlink::backends

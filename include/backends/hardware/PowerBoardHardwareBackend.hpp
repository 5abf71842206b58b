#pragma once
/** @file  PowerBoardHardwareBackend.hpp
 *  @brief USB backend for the SR v4 power board running legacy firmware, and power
 *         board discovery across both firmware generations.
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
#include "backends/hardware/UsbHardwareBackend.hpp"
#include "boards/PowerBoard.hpp"

namespace boardlink::backends {

  /// Where to look for power boards: legacy firmware on USB, 4.x firmware on serial.
  struct PowerBoardConfig {
    UsbConfig usb;
    SerialConfig serial;
  };

  /**
 * @class PowerBoardHardwareBackend
 * @brief Legacy boards expose a single USB interface (the DFU updater). Boards on
 *        newer firmware expose a serial port instead and are driven by
 *        `PowerBoardSerialHardwareBackend`; `discover()` returns both kinds.
 *
 *  * Only firmware "3" is accepted.
 *  * Outputs H0..L3 are switchable; the 5V rail is not.
 *  * Output and LED states cannot be read back; reads return the last value written.
 */
  class PowerBoardHardwareBackend : public UsbHardwareBackend,
                                    public components::PowerOutputInterface,
                                    public components::PiezoInterface,
                                    public components::ButtonInterface,
                                    public components::BatterySensorInterface,
                                    public components::LedInterface {
  public:
    using BoardType = boards::PowerBoard;
    using Config = PowerBoardConfig;

    static constexpr const char* kName = "PowerBoardHardwareBackend";

    static constexpr std::uint16_t kVendorId = 0x1bda;
    static constexpr std::uint16_t kProductId = 0x0010;
    static constexpr const char* kSupportedFirmware = "3";
    static constexpr int kOutputCount = 6;

    // command codes, as numbered in the firmware's usb.h
    static constexpr protocols::ReadCommand kCmdReadBattery{ 7, 8 };
    static constexpr protocols::ReadCommand kCmdReadButton{ 8, 4 };
    static constexpr protocols::ReadCommand kCmdReadFirmware{ 9, 4 };
    static constexpr protocols::WriteCommand kCmdWriteRunLed{ 6 };
    static constexpr protocols::WriteCommand kCmdWriteErrorLed{ 7 };
    static constexpr protocols::WriteCommand kCmdWritePiezo{ 8 };

    static constexpr std::chrono::milliseconds kButtonPollInterval{ 50 };

    static bool isLegacyFirmware(const io::UsbDeviceInfo& info) { return info.numInterfaces == 1; }

    /// Legacy boards from `config.usb` followed by serial boards from `config.serial`.
    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    /// @throws core::UnsupportedFirmware for anything but firmware "3".
    PowerBoardHardwareBackend(std::unique_ptr<io::UsbDevice> handle, const UsbConfig& config);

    std::optional<std::string> firmwareVersion() override;

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
    std::string readFirmwareVersion();

    std::array<bool, kOutputCount> outputs_{};
    std::array<bool, 2> leds_{};
  };

} // namespace boardlink::backends

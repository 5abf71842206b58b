#pragma once
/** @file  ServoBoardHardwareBackend.hpp
 *  @brief USB backend for the SR v4 servo board.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// boardlink headers
#include "backends/hardware/UsbHardwareBackend.hpp"
#include "boards/ServoBoard.hpp"

namespace boardlink::backends {

  /**
 * @class ServoBoardHardwareBackend
 * @brief Servo positions are written as `round(position * 100)` in wValue.
 *
 *  * Only firmware "2" is accepted.
 *  * Servos cannot be unpowered; `nullopt` raises `core::NotSupportedByHardware`.
 *  * Reads return the last position written (every servo starts at 0).
 */
  class ServoBoardHardwareBackend : public UsbHardwareBackend,
                                    public components::ServoInterface {
  public:
    using BoardType = boards::ServoBoard;
    using Config = UsbConfig;

    static constexpr const char* kName = "ServoBoardHardwareBackend";

    static constexpr std::uint16_t kVendorId = 0x1bda;
    static constexpr std::uint16_t kProductId = 0x0011;
    static constexpr const char* kSupportedFirmware = "2";

    static constexpr protocols::ReadCommand kCmdReadFirmware{ 9, 4 };
    static constexpr protocols::WriteCommand kCmdWriteInit{ 12 };

    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    /// Checks the firmware, initialises the board and centres every servo.
    /// @throws core::UnsupportedFirmware for anything but firmware "2".
    ServoBoardHardwareBackend(std::unique_ptr<io::UsbDevice> handle, const Config& config);

    std::optional<std::string> firmwareVersion() override;

    components::ServoPosition getServoPosition(int identifier) override;
    void setServoPosition(int identifier, components::ServoPosition position) override;

  private:
    std::string readFirmwareVersion();
    void writeServo(int identifier, double position);

    std::array<double, boards::ServoBoard::kServoCount> positions_{};
  };

} // namespace boardlink::backends

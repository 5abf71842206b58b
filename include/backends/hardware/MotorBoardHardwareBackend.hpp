#pragma once
/** @file  MotorBoardHardwareBackend.hpp
 *  @brief Serial backend for the MCV4B motor board.
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
#include "backends/hardware/SerialHardwareBackend.hpp"
#include "boards/MotorBoard.hpp"

namespace boardlink::backends {

  /**
 * @class MotorBoardHardwareBackend
 * @brief Byte protocol at 1 Mbaud: `[command]` or `[command, value]`.
 *
 *  * Matches FTDI 0403:6001 ports reporting "Student Robotics" / "MCV4B".
 *  * Only firmware "3" is accepted.
 *  * Both motors are braked on open and on destruction.
 *  * The board cannot report motor state; reads return the last value written.
 */
  class MotorBoardHardwareBackend : public SerialHardwareBackend,
                                    public components::MotorInterface {
  public:
    using BoardType = boards::MotorBoard;
    using Config = SerialConfig;

    static constexpr const char* kName = "MotorBoardHardwareBackend";

    static constexpr std::uint16_t kVendorId = 0x0403;
    static constexpr std::uint16_t kProductId = 0x6001;
    static constexpr const char* kManufacturer = "Student Robotics";
    static constexpr const char* kProduct = "MCV4B";
    static constexpr unsigned int kBaud = 1000000;
    static constexpr const char* kSupportedFirmware = "3";

    // command bytes
    static constexpr std::uint8_t kCmdReset = 0;
    static constexpr std::uint8_t kCmdVersion = 1;
    static constexpr std::array<std::uint8_t, 2> kCmdMotor{ 2, 3 };
    static constexpr std::uint8_t kSpeedCoast = 1;
    static constexpr std::uint8_t kSpeedBrake = 2;

    static bool isMotorBoard(const io::SerialPortInfo& port);

    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    /// Checks the firmware and brakes both motors.
    /// @throws core::UnsupportedFirmware for anything but firmware "3".
    MotorBoardHardwareBackend(std::unique_ptr<io::SerialChannel> channel,
                              const io::SerialPortInfo& port, const Config& config);
    ~MotorBoardHardwareBackend() override;

    std::optional<std::string> firmwareVersion() override;

    components::MotorState getMotorState(int identifier) override;
    void setMotorState(int identifier, const components::MotorState& state) override;

    /// Byte sent for \p state; powers map to round(p * 125) + 128.
    static std::uint8_t encode(const components::MotorState& state);

  private:
    std::string queryVersion();
    void writeMotor(int identifier, const components::MotorState& state);

    std::array<components::MotorState, 2> states_{ components::MotorSpecialState::Brake,
                                                   components::MotorSpecialState::Brake };
  };

} // namespace boardlink::backends

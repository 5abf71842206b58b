#pragma once
/** @file  RuggeduinoHardwareBackend.hpp
 *  @brief Serial backend for the Ruggeduino running SRduino or custom firmware.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// boardlink headers
#include "backends/hardware/SerialHardwareBackend.hpp"
#include "boards/Ruggeduino.hpp"
#include "protocols/Command.hpp"

namespace boardlink::backends {

  /**
 * @class RuggeduinoHardwareBackend
 * @brief ASCII protocol at 115200 baud: one command letter, then the pin as a letter.
 *
 *  * The board answers `v` with `<model>:<version>`; SRduino firmware reports
 *    model "SRduino". Only version "1" is accepted.
 *  * String commands are only passed through on custom (non-SRduino) firmware.
 *  * The LED is digital pin 13.
 */
  class RuggeduinoHardwareBackend : public SerialHardwareBackend,
                                    public components::GpioPinInterface,
                                    public components::LedInterface,
                                    public components::StringCommandInterface {
  public:
    using BoardType = boards::Ruggeduino;
    using Config = SerialConfig;

    static constexpr const char* kName = "RuggeduinoHardwareBackend";

    static constexpr unsigned int kBaud = 115200;
    static constexpr const char* kOfficialModel = "SRduino";
    static constexpr const char* kSupportedFirmware = "1";
    static constexpr int kMaxEmptyVersionReplies = 25;
    static constexpr int kLedPin = 13;
    static constexpr double kAnalogueReference = 5.0;
    static constexpr double kAdcSteps = 1024.0;

    /// Uno USB identities (genuine and clones).
    static constexpr std::array<std::pair<std::uint16_t, std::uint16_t>, 3> kUsbIds{ {
        { 0x2341, 0x0043 },
        { 0x2a03, 0x0043 },
        { 0x1a86, 0x7523 },
    } };

    static bool isArduinoUno(const io::SerialPortInfo& port);

    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    /// Waits for the board to answer the version query.
    /// @throws core::CommunicationError when it never answers.
    /// @throws core::UnsupportedFirmware for anything but version "1".
    RuggeduinoHardwareBackend(std::unique_ptr<io::SerialChannel> channel,
                              const io::SerialPortInfo& port, const Config& config);

    std::optional<std::string> firmwareVersion() override;
    bool isOfficialFirmware() const { return model_ == kOfficialModel; }

    void setGpioPinMode(int identifier, components::GpioPinMode mode) override;
    components::GpioPinMode getGpioPinMode(int identifier) override;
    void writeGpioPinDigitalState(int identifier, bool state) override;
    bool getGpioPinDigitalState(int identifier) override;
    bool readGpioPinDigitalState(int identifier) override;
    double readGpioPinAnalogueValue(int identifier) override;

    bool getLedState(int identifier) override;
    void setLedState(int identifier, bool state) override;

    /// @throws core::NotSupportedByHardware on SRduino firmware.
    std::string executeStringCommand(const std::string& command) override;

  private:
    struct PinData {
      components::GpioPinMode mode;
      bool digitalState{ false };
    };

    /// Sends \p command and returns the reply line, empty when the board stays silent.
    std::string execute(const protocols::Command& command);
    std::string executeRaw(const std::string& wire);

    PinData& pin(int identifier);
    void writeDigital(int identifier, bool state);

    std::string model_;
    std::string version_;
    std::map<int, PinData> pins_;
  };

} // namespace boardlink::backends

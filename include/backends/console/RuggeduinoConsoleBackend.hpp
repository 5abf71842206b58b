#pragma once
/** @file  RuggeduinoConsoleBackend.hpp
 *  @brief Console backend for the Ruggeduino.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "backends/console/ConsoleBackend.hpp"
#include "boards/Ruggeduino.hpp"

namespace boardlink::backends {

  /// The LED is wired to digital pin 13 and shares its state.
  class RuggeduinoConsoleBackend : public ConsoleBackend,
                                   public components::GpioPinInterface,
                                   public components::LedInterface,
                                   public components::StringCommandInterface {
  public:
    using BoardType = boards::Ruggeduino;
    using Config = ConsoleConfig;

    static constexpr const char* kName = "RuggeduinoConsoleBackend";
    static constexpr int kLedPin = 13;

    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    RuggeduinoConsoleBackend(std::string serial, const Config& config);

    void setGpioPinMode(int identifier, components::GpioPinMode mode) override;
    components::GpioPinMode getGpioPinMode(int identifier) override;
    void writeGpioPinDigitalState(int identifier, bool state) override;
    bool getGpioPinDigitalState(int identifier) override;
    bool readGpioPinDigitalState(int identifier) override;
    double readGpioPinAnalogueValue(int identifier) override;

    bool getLedState(int identifier) override;
    void setLedState(int identifier, bool state) override;

    std::string executeStringCommand(const std::string& command) override;

  private:
    struct PinData {
      components::GpioPinMode mode{ components::GpioPinMode::DigitalOutput };
      bool digitalState{ false };
    };

    PinData& pin(int identifier);

    std::map<int, PinData> pins_;
  };

} // namespace boardlink::backends

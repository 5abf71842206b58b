#pragma once
/** @file  PowerBoardConsoleBackend.hpp
 *  @brief Console backend for the power board.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "backends/console/ConsoleBackend.hpp"
#include "boards/PowerBoard.hpp"

namespace boardlink::backends {

  /// Simulates a board with a switchable 5V regulator, so all seven outputs exist.
  class PowerBoardConsoleBackend : public ConsoleBackend,
                                   public components::PowerOutputInterface,
                                   public components::PiezoInterface,
                                   public components::ButtonInterface,
                                   public components::BatterySensorInterface,
                                   public components::LedInterface {
  public:
    using BoardType = boards::PowerBoard;
    using Config = ConsoleConfig;

    static constexpr const char* kName = "PowerBoardConsoleBackend";
    static constexpr boards::PowerBoard::Features kFeatures{ false, true };

    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    PowerBoardConsoleBackend(std::string serial, const Config& config)
        : ConsoleBackend("PowerBoard", std::move(serial), config) {}

    bool getPowerOutputEnabled(int identifier) override;
    void setPowerOutputEnabled(int identifier, bool enabled) override;
    double getPowerOutputCurrent(int identifier) override;

    void buzz(int identifier, std::chrono::milliseconds duration, double frequencyHz,
              bool blocking) override;

    bool getButtonState(int identifier) override;
    void waitUntilButtonPressed(int identifier) override;

    double getBatterySensorVoltage(int identifier) override;
    double getBatterySensorCurrent(int identifier) override;

    bool getLedState(int identifier) override;
    void setLedState(int identifier, bool state) override;

  private:
    std::array<bool, 7> outputs_{};
    std::array<bool, 2> leds_{};
  };

} // namespace boardlink::backends

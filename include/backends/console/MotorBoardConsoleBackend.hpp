#pragma once
/** @file  MotorBoardConsoleBackend.hpp
 *  @brief Console backend for the motor board.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <memory>
#include <string>
#include <vector>

#include "backends/console/ConsoleBackend.hpp"
#include "boards/MotorBoard.hpp"

namespace boardlink::backends {

  class MotorBoardConsoleBackend : public ConsoleBackend, public components::MotorInterface {
  public:
    using BoardType = boards::MotorBoard;
    using Config = ConsoleConfig;

    static constexpr const char* kName = "MotorBoardConsoleBackend";

    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    MotorBoardConsoleBackend(std::string serial, const Config& config)
        : ConsoleBackend("MotorBoard", std::move(serial), config) {}

    components::MotorState getMotorState(int identifier) override;
    void setMotorState(int identifier, const components::MotorState& state) override;

  private:
    std::array<components::MotorState, 2> states_{ components::MotorSpecialState::Brake,
                                                   components::MotorSpecialState::Brake };
  };

} // namespace boardlink::backends

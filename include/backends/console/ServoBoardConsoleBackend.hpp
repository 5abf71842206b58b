#pragma once
/** @file  ServoBoardConsoleBackend.hpp
 *  @brief Console backend for the servo board.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <memory>
#include <string>
#include <vector>

#include "backends/console/ConsoleBackend.hpp"
#include "boards/ServoBoard.hpp"

namespace boardlink::backends {

  class ServoBoardConsoleBackend : public ConsoleBackend, public components::ServoInterface {
  public:
    using BoardType = boards::ServoBoard;
    using Config = ConsoleConfig;

    static constexpr const char* kName = "ServoBoardConsoleBackend";

    static std::vector<std::unique_ptr<BoardType>> discover(const Config& config);

    ServoBoardConsoleBackend(std::string serial, const Config& config)
        : ConsoleBackend("ServoBoard", std::move(serial), config) {}

    components::ServoPosition getServoPosition(int identifier) override;
    void setServoPosition(int identifier, components::ServoPosition position) override;

  private:
    std::array<components::ServoPosition, boards::ServoBoard::kServoCount> positions_{};
  };

} // namespace boardlink::backends

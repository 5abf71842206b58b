#pragma once
/** @file  MotorBoard.hpp
 *  @brief Two-channel brushed motor controller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <utility>

#include "boards/Board.hpp"
#include "components/ComponentList.hpp"
#include "components/Motor.hpp"

namespace boardlink::boards {

  class MotorBoard : public Board {
  public:
    using RequiredInterfaces = components::InterfaceList<components::MotorInterface>;

    static constexpr const char* kName = "Student Robotics v4 Motor Board";

    template <typename BackendT>
      requires components::ImplementsInterfaces<BackendT, RequiredInterfaces>
    explicit MotorBoard(std::unique_ptr<BackendT> backend,
                        components::MotorState safeState = components::MotorSpecialState::Brake)
        : Board(std::move(backend)), motors_({ 0, 1 }, backendAs<BackendT>()),
          safeState_(safeState) {}

    std::string name() const override { return kName; }

    components::ComponentList<components::Motor>& motors() { return motors_; }

    const components::MotorState& safeState() const { return safeState_; }

  protected:
    void makeComponentsSafe(core::SafetyReport& report) override;

  private:
    components::ComponentList<components::Motor> motors_;
    const components::MotorState safeState_;
  };

} // namespace boardlink::boards

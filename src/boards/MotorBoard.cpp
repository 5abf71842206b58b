/* @file MotorBoard.cpp
 * @brief motor board safing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// boardlink headers
#include "boards/MotorBoard.hpp"

using namespace boardlink::boards;

void MotorBoard::makeComponentsSafe(core::SafetyReport& report) {
  for (auto& motor : motors_)
    attempt(report, "Motor", motor.identifier(), [&] { motor.setPower(safeState_); });
}

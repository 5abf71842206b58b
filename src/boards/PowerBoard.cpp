/* @file PowerBoard.cpp
 * @brief power board output filtering, start flash and safing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <thread>

// boardlink headers
#include "boards/PowerBoard.hpp"

namespace boardlink::boards {

  namespace {
    constexpr PowerOutputPosition kAllOutputs[] = {
      PowerOutputPosition::H0, PowerOutputPosition::H1, PowerOutputPosition::L0,
      PowerOutputPosition::L1, PowerOutputPosition::L2, PowerOutputPosition::L3,
      PowerOutputPosition::FiveVolt,
    };

    // run LED toggles every this many polls
    constexpr int kFlashDivider = 6;
  } // namespace

  const char* toString(PowerOutputPosition position) {
    switch (position) {
    case PowerOutputPosition::H0:
      return "H0";
    case PowerOutputPosition::H1:
      return "H1";
    case PowerOutputPosition::L0:
      return "L0";
    case PowerOutputPosition::L1:
      return "L1";
    case PowerOutputPosition::L2:
      return "L2";
    case PowerOutputPosition::L3:
      return "L3";
    case PowerOutputPosition::FiveVolt:
      return "5V";
    }
    return "?";
  }

  std::vector<int> PowerBoard::controllableOutputs(const Features& features) {
    std::vector<int> ids;
    for (PowerOutputPosition position : kAllOutputs) {
      if (features.brainOutput && position == PowerOutputPosition::L2)
        continue;
      if (!features.regulator5vControl && position == PowerOutputPosition::FiveVolt)
        continue;
      ids.push_back(static_cast<int>(position));
    }
    return ids;
  }

  components::PowerOutputGroup PowerBoard::outputs() {
    std::vector<std::reference_wrapper<components::PowerOutput>> refs;
    for (auto& output : outputs_)
      refs.emplace_back(output);
    return components::PowerOutputGroup(std::move(refs));
  }

  void PowerBoard::waitForStartFlash(std::chrono::milliseconds pollInterval) {
    int counter = 0;
    bool ledState = false;
    while (!startButton_.isPressed()) {
      if (counter % kFlashDivider == 0) {
        ledState = !ledState;
        runLed().setState(ledState);
      }
      std::this_thread::sleep_for(pollInterval);
      ++counter;
    }
    runLed().setState(true);
  }

  void PowerBoard::makeComponentsSafe(core::SafetyReport& report) {
    for (auto& output : outputs_)
      attempt(report, "PowerOutput", output.identifier(), [&] { output.setEnabled(false); });
  }

} // namespace boardlink::boards

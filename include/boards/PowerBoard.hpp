#pragma once
/** @file  PowerBoard.hpp
 *  @brief Power distribution board: switched outputs, battery monitor, start button.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "boards/Board.hpp"
#include "components/BatterySensor.hpp"
#include "components/Button.hpp"
#include "components/ComponentList.hpp"
#include "components/Led.hpp"
#include "components/Piezo.hpp"
#include "components/PowerOutput.hpp"

namespace boardlink::boards {

  /// Output numbering matches the board's wire protocol.
  enum class PowerOutputPosition { H0 = 0, H1 = 1, L0 = 2, L1 = 3, L2 = 4, L3 = 5, FiveVolt = 6 };

  const char* toString(PowerOutputPosition position);

  /**
 * @class PowerBoard
 * @brief Outputs H0..L3 (plus 5V where the regulator is controllable), one piezo,
 *        the start button, the battery sensor and the run (0) / error (1) LEDs.
 */
  class PowerBoard : public Board {
  public:
    using RequiredInterfaces =
        components::InterfaceList<components::PowerOutputInterface, components::PiezoInterface,
                                  components::ButtonInterface,
                                  components::BatterySensorInterface, components::LedInterface>;

    static constexpr const char* kName = "Student Robotics v4 Power Board";

    struct Features {
      bool brainOutput{ false };        ///< the brain is powered from L2; L2 is not exposed
      bool regulator5vControl{ false }; ///< the 5V output can be switched
    };

    static constexpr int kRunLed = 0;
    static constexpr int kErrorLed = 1;

    template <typename BackendT>
      requires components::ImplementsInterfaces<BackendT, RequiredInterfaces>
    explicit PowerBoard(std::unique_ptr<BackendT> backend, Features features = {})
        : Board(std::move(backend)), features_(features),
          outputs_(controllableOutputs(features), backendAs<BackendT>()),
          piezo_(0, backendAs<BackendT>()), startButton_(0, backendAs<BackendT>()),
          batterySensor_(0, backendAs<BackendT>()), leds_({ kRunLed, kErrorLed },
                                                          backendAs<BackendT>()) {}

    std::string name() const override { return kName; }

    const Features& features() const { return features_; }

    /// @throws core::InvalidArgument when \p position is not controllable on this board.
    components::PowerOutput& output(PowerOutputPosition position) {
      return outputs_.byIdentifier(static_cast<int>(position));
    }

    /// Every controllable output, switched together.
    components::PowerOutputGroup outputs();

    components::Piezo& piezo() { return piezo_; }
    components::Button& startButton() { return startButton_; }
    components::BatterySensor& batterySensor() { return batterySensor_; }
    components::Led& runLed() { return leds_[kRunLed]; }
    components::Led& errorLed() { return leds_[kErrorLed]; }

    /// Flashes the run LED until the start button is pressed, then leaves it lit.
    void waitForStartFlash(std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));

    static std::vector<int> controllableOutputs(const Features& features);

  protected:
    void makeComponentsSafe(core::SafetyReport& report) override;

  private:
    const Features features_;
    components::ComponentList<components::PowerOutput> outputs_;
    components::Piezo piezo_;
    components::Button startButton_;
    components::BatterySensor batterySensor_;
    components::ComponentList<components::Led> leds_;
  };

} // namespace boardlink::boards

#pragma once
/** @file  Ruggeduino.hpp
 *  @brief Arduino Uno compatible I/O board.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "boards/Board.hpp"
#include "components/ComponentList.hpp"
#include "components/GpioPin.hpp"
#include "components/Led.hpp"
#include "components/StringCommand.hpp"

namespace boardlink::boards {

  /// Uno numbering of the analogue header.
  enum class AnaloguePin { A0 = 14, A1 = 15, A2 = 16, A3 = 17, A4 = 18, A5 = 19 };

  /**
 * @class Ruggeduino
 * @brief Digital pins 2..13 (0 and 1 carry the serial link), analogue pins
 *        A0..A5 (14..19), the on-board LED and a raw string-command channel.
 */
  class Ruggeduino : public Board {
  public:
    using RequiredInterfaces =
        components::InterfaceList<components::GpioPinInterface, components::LedInterface,
                                  components::StringCommandInterface>;

    static constexpr const char* kName = "Ruggeduino";

    static constexpr int kFirstDigitalPin = 2;
    static constexpr int kFirstAnaloguePin = static_cast<int>(AnaloguePin::A0);
    static constexpr int kLastAnaloguePin = static_cast<int>(AnaloguePin::A5);

    template <typename BackendT>
      requires components::ImplementsInterfaces<BackendT, RequiredInterfaces>
    explicit Ruggeduino(std::unique_ptr<BackendT> backend)
        : Board(std::move(backend)), led_(0, backendAs<BackendT>()),
          analoguePins_(pinRange(kFirstAnaloguePin, kLastAnaloguePin), backendAs<BackendT>(),
                        analoguePinModes(), components::GpioPinMode::AnalogueInput),
          digitalPins_(pinRange(kFirstDigitalPin, kFirstAnaloguePin - 1), backendAs<BackendT>(),
                       digitalPinModes(), components::GpioPinMode::DigitalInput),
          command_(0, backendAs<BackendT>()) {}

    std::string name() const override { return kName; }

    /// Pin by Uno number (2..19). @throws core::InvalidArgument for any other number.
    components::GpioPin& pin(int number);
    components::GpioPin& pin(AnaloguePin analogue) { return pin(static_cast<int>(analogue)); }

    components::ComponentList<components::GpioPin>& digitalPins() { return digitalPins_; }
    components::ComponentList<components::GpioPin>& analoguePins() { return analoguePins_; }

    components::Led& led() { return led_; }
    components::StringCommand& command() { return command_; }

  protected:
    void makeComponentsSafe(core::SafetyReport& report) override;

  private:
    static std::vector<int> pinRange(int first, int last);
    static std::vector<components::GpioPinMode> digitalPinModes();
    static std::vector<components::GpioPinMode> analoguePinModes();

    components::Led led_;
    components::ComponentList<components::GpioPin> analoguePins_;
    components::ComponentList<components::GpioPin> digitalPins_;
    components::StringCommand command_;
  };

} // namespace boardlink::boards

#pragma once
/** @file  GpioPin.hpp
 *  @brief General purpose I/O pin with hardware modes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <initializer_list>
#include <optional>
#include <vector>

#include "components/Component.hpp"

namespace boardlink::components {

  enum class GpioPinMode {
    DigitalInput,         ///< digital state can be read
    DigitalInputPullup,   ///< as DigitalInput with the internal pull-up enabled
    DigitalInputPulldown, ///< as DigitalInput with the internal pull-down enabled
    DigitalOutput,        ///< digital state can be set
    AnalogueInput,        ///< voltage can be read
    AnalogueOutput,       ///< voltage can be set through a DAC
    PwmOutput,            ///< PWM signal can be generated
  };

  const char* toString(GpioPinMode mode);

  class GpioPinInterface {
  public:
    virtual ~GpioPinInterface() = default;

    virtual void setGpioPinMode(int identifier, GpioPinMode mode) = 0;
    virtual GpioPinMode getGpioPinMode(int identifier) = 0;
    virtual void writeGpioPinDigitalState(int identifier, bool state) = 0;
    /// Last state written to an output pin.
    virtual bool getGpioPinDigitalState(int identifier) = 0;
    /// State sampled from an input pin.
    virtual bool readGpioPinDigitalState(int identifier) = 0;
    /// Voltage sampled from an analogue input pin, in volts.
    virtual double readGpioPinAnalogueValue(int identifier) = 0;
  };

  /**
 * @class GpioPin
 * @brief Pin with a fixed list of supported modes; applies its initial mode on
 *        construction (the first supported mode unless one is given).
 *
 *  * Unsupported modes raise `core::NotSupportedByHardware`.
 *  * Reads/writes in the wrong mode raise `core::BadGpioPinMode`.
 */
  class GpioPin : public Component {
  public:
    GpioPin(int identifier, GpioPinInterface& backend, std::vector<GpioPinMode> supportedModes,
            std::optional<GpioPinMode> initialMode = std::nullopt);

    GpioPinMode mode() const { return backend_.getGpioPinMode(identifier()); }
    void setMode(GpioPinMode mode);

    /// Output pins report the last written state, input pins are sampled.
    bool digitalState() const;
    void setDigitalState(bool state);

    double analogueValue() const;

    const std::vector<GpioPinMode>& supportedModes() const { return supportedModes_; }

  private:
    void requireMode(std::initializer_list<GpioPinMode> modes, GpioPinMode current) const;

    GpioPinInterface& backend_;
    const std::vector<GpioPinMode> supportedModes_;
  };

} // namespace boardlink::components

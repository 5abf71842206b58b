#pragma once
/** @file  PowerOutput.hpp
 *  @brief Switchable power output channel with current sensing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "components/Component.hpp"

namespace boardlink::components {

  class PowerOutputInterface {
  public:
    virtual ~PowerOutputInterface() = default;

    virtual bool getPowerOutputEnabled(int identifier) = 0;
    virtual void setPowerOutputEnabled(int identifier, bool enabled) = 0;
    /// Current drawn on the output, in amperes.
    virtual double getPowerOutputCurrent(int identifier) = 0;
  };

  class PowerOutput : public Component {
  public:
    PowerOutput(int identifier, PowerOutputInterface& backend)
        : Component(identifier), backend_(backend) {}

    bool isEnabled() const { return backend_.getPowerOutputEnabled(identifier()); }
    void setEnabled(bool enabled) { backend_.setPowerOutputEnabled(identifier(), enabled); }

    double current() const { return backend_.getPowerOutputCurrent(identifier()); }

  private:
    PowerOutputInterface& backend_;
  };

  /// Non-owning view over a board's outputs for switching them together.
  class PowerOutputGroup {
  public:
    PowerOutputGroup() = default;
    explicit PowerOutputGroup(std::vector<std::reference_wrapper<PowerOutput>> outputs)
        : outputs_(std::move(outputs)) {}

    void powerOn() {
      for (PowerOutput& output : outputs_)
        output.setEnabled(true);
    }

    void powerOff() {
      for (PowerOutput& output : outputs_)
        output.setEnabled(false);
    }

    std::size_t size() const { return outputs_.size(); }

    auto begin() const { return outputs_.begin(); }
    auto end() const { return outputs_.end(); }

  private:
    std::vector<std::reference_wrapper<PowerOutput>> outputs_;
  };

} // namespace boardlink::components

#pragma once
/** @file  Piezo.hpp
 *  @brief Piezo sounder that plays tones of a given pitch and length.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <variant>

#include "components/Component.hpp"

namespace boardlink::components {

  enum class Note { C6, D6, E6, F6, G6, A6, B6, C7, D7, E7, F7, G7, A7, B7 };

  /// Frequency of \p note in Hz.
  double frequency(Note note);

  /// A named note or a frequency in Hz.
  using Pitch = std::variant<double, Note>;

  class PiezoInterface {
  public:
    virtual ~PiezoInterface() = default;

    virtual void buzz(int identifier, std::chrono::milliseconds duration, double frequencyHz,
                      bool blocking) = 0;
  };

  class Piezo : public Component {
  public:
    Piezo(int identifier, PiezoInterface& backend) : Component(identifier), backend_(backend) {}

    /// Throws `core::InvalidArgument` for negative durations or non-positive frequencies.
    void buzz(std::chrono::milliseconds duration, Pitch pitch, bool blocking = false);

  private:
    PiezoInterface& backend_;
  };

} // namespace boardlink::components

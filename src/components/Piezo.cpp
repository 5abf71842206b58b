/* @file Piezo.cpp
 * @brief note table and buzz validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cmath>
#include <cstddef>
#include <string>

// boardlink headers
#include "components/Piezo.hpp"
#include "core/Errors.hpp"

namespace boardlink::components {

  double frequency(Note note) {
    static constexpr std::array<double, 14> kFrequencies{
      1046.50, 1174.66, 1318.51, 1396.91, 1567.98, 1760.00, 1975.53,
      2093.00, 2349.32, 2637.02, 2793.83, 3135.96, 3520.00, 3951.07,
    };
    return kFrequencies[static_cast<std::size_t>(note)];
  }

  void Piezo::buzz(std::chrono::milliseconds duration, Pitch pitch, bool blocking) {
    if (duration.count() < 0)
      throw core::InvalidArgument("Piezo duration must not be negative.");

    const double hz =
        std::holds_alternative<Note>(pitch) ? frequency(std::get<Note>(pitch)) : std::get<double>(pitch);
    if (!std::isfinite(hz) || hz <= 0.0)
      throw core::InvalidArgument("Piezo frequency must be positive, got " + std::to_string(hz));

    backend_.buzz(identifier(), duration, hz, blocking);
  }

} // namespace boardlink::components

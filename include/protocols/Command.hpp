#pragma once
/** @file  Command.hpp
 *  @brief Single-character Ruggeduino command with optional pin operand.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

namespace boardlink {
  namespace protocols {
    struct Command {
      char op;
      std::optional<int> pin;

      /// Pins travel as letters: 0 → 'a', 1 → 'b', ...
      std::string toWire() const {
        std::string wire(1, op);
        if (pin)
          wire += static_cast<char>('a' + *pin);
        return wire;
      }
    };

  } // namespace protocols
} // namespace boardlink

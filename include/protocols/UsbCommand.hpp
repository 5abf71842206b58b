#pragma once
/** @file  UsbCommand.hpp
 *  @brief Control-transfer command descriptors and little-endian payload helpers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <vector>

namespace boardlink {
  namespace protocols {

    /// bRequest used by every SR v4 USB board.
    constexpr std::uint8_t kBoardRequest = 64;

    /// Read `dataLength` bytes; `code` travels in wIndex.
    struct ReadCommand {
      std::uint16_t code;
      std::uint16_t dataLength;
    };

    /// Write with `code` in wIndex and the parameter in wValue or the data stage.
    struct WriteCommand {
      std::uint16_t code;
    };

    /// Decodes a little-endian u32 at \p offset; caller checks the size first.
    inline std::uint32_t readU32LE(const std::vector<std::uint8_t>& bytes, std::size_t offset = 0) {
      return static_cast<std::uint32_t>(bytes[offset]) |
             (static_cast<std::uint32_t>(bytes[offset + 1]) << 8) |
             (static_cast<std::uint32_t>(bytes[offset + 2]) << 16) |
             (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
    }

    inline void appendU16LE(std::vector<std::uint8_t>& out, std::uint16_t value) {
      out.push_back(static_cast<std::uint8_t>(value & 0xff));
      out.push_back(static_cast<std::uint8_t>(value >> 8));
    }

  } // namespace protocols
} // namespace boardlink

#pragma once
/** @file  Sysfs.hpp
 *  @brief Small helpers for reading sysfs attribute files.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace boardlink::io::sysfs {

  /// Contents of \p file without the trailing newline, or nullopt if unreadable.
  std::optional<std::string> readAttribute(const std::filesystem::path& file);

  /// Attribute parsed as a hexadecimal 16-bit value (idVendor, idProduct).
  std::optional<std::uint16_t> readHexAttribute(const std::filesystem::path& file);

  /// Attribute parsed as a decimal integer (busnum, devnum, bNumInterfaces).
  std::optional<int> readIntAttribute(const std::filesystem::path& file);

} // namespace boardlink::io::sysfs

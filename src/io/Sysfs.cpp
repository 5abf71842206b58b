/* @file Sysfs.cpp
 * @brief sysfs attribute readers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <fstream>
#include <sstream>

// boardlink headers
#include "io/Sysfs.hpp"

namespace boardlink::io::sysfs {

  std::optional<std::string> readAttribute(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in)
      return std::nullopt;

    std::ostringstream contents;
    contents << in.rdbuf();
    std::string value = contents.str();
    while (!value.empty() && (value.back() == '\n' || value.back() == ' '))
      value.pop_back();
    return value;
  }

  std::optional<std::uint16_t> readHexAttribute(const std::filesystem::path& file) {
    auto text = readAttribute(file);
    if (!text || text->empty())
      return std::nullopt;

    std::uint16_t value = 0;
    auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), value, 16);
    if (ec != std::errc{} || end != text->data() + text->size())
      return std::nullopt;
    return value;
  }

  std::optional<int> readIntAttribute(const std::filesystem::path& file) {
    auto text = readAttribute(file);
    if (!text || text->empty())
      return std::nullopt;

    // bNumInterfaces is space padded, e.g. " 1"
    const auto first = text->find_first_not_of(' ');
    if (first == std::string::npos)
      return std::nullopt;

    int value = 0;
    auto [end, ec] = std::from_chars(text->data() + first, text->data() + text->size(), value);
    if (ec != std::errc{} || end != text->data() + text->size())
      return std::nullopt;
    return value;
  }

} // namespace boardlink::io::sysfs

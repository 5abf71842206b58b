/* @file Console.cpp
 * @brief console reply parsing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// boardlink headers
#include "backends/console/Console.hpp"

namespace boardlink::backends {

  bool Console::parse(const std::string& text, bool& value) {
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c); })
                    .base();
    std::string word = first < last ? std::string(first, last) : std::string();
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (word == "true" || word == "yes") {
      value = true;
      return true;
    }
    if (word == "false" || word == "no") {
      value = false;
      return true;
    }
    return false;
  }

} // namespace boardlink::backends

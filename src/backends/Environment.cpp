/* @file Environment.cpp
 * @brief environment merging
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// boardlink headers
#include "backends/Environment.hpp"

using namespace boardlink::backends;

void Environment::merge(const Environment& other) {
  if (&other == this)
    return;
  std::scoped_lock lk(mtx_, other.mtx_);

  std::string common;
  for (const auto& [type, entry] : other.registry_) {
    if (registry_.count(type) != 0)
      common += (common.empty() ? "" : ", ") + entry.boardName;
  }
  if (!common.empty())
    throw std::runtime_error("Attempted to merge two Environments that both contain: " + common);

  for (const auto& [type, entry] : other.registry_)
    registry_.emplace(type, entry);
}

std::vector<std::string> Environment::supportedBoards() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<std::string> names;
  for (const auto& [type, entry] : registry_)
    names.push_back(entry.boardName);
  std::sort(names.begin(), names.end());
  return names;
}

/* @file SafetyReport.cpp
 * @brief safety report formatting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// boardlink headers
#include "core/SafetyReport.hpp"

using namespace boardlink::core;

std::string ComponentFault::toString() const {
  return board + ": " + component + " " + std::to_string(identifier) + ": " + message;
}

std::string SafetyReport::toString() const {
  std::string out;
  for (const auto& fault : faults_) {
    out += fault.toString();
    out += '\n';
  }
  return out;
}

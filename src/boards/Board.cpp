/* @file Board.cpp
 * @brief board identity and make-safe driver
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// boardlink headers
#include "boards/Board.hpp"

using namespace boardlink::boards;

Board::Board(std::unique_ptr<backends::Backend> backend) : backend_(std::move(backend)) {
  if (!backend_)
    throw std::invalid_argument("[Board] backend is nullptr");
}

boardlink::core::SafetyReport Board::makeSafe() {
  core::SafetyReport report;
  makeComponentsSafe(report);
  return report;
}

std::string Board::toString() const { return name() + " - " + serialNumber(); }

std::string Board::safeDescription() const {
  try {
    return toString();
  } catch (const std::exception&) {
    return name(); // the backend may already be unreachable
  }
}

/* @file Robot.cpp
 * @brief robot-wide safing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>

// boardlink headers
#include "core/Robot.hpp"

using namespace boardlink::core;

Robot::Robot(backends::Environment environment, std::shared_ptr<ErrorMonitor> errorMonitor,
             std::shared_ptr<Logger> logger)
    : environment_(std::move(environment)), errorMonitor_(std::move(errorMonitor)),
      logger_(logger ? std::move(logger) : defaultLogger()) {
  if (!errorMonitor_)
    throw std::invalid_argument("[Robot] error monitor is nullptr");
  logger_->info("Robot", "using " + environment_.name());
}

Robot::~Robot() {
  try {
    makeSafe();
  } catch (const std::exception& e) {
    logger_->error("Robot", std::string("make safe on shutdown failed: ") + e.what());
  }
}

SafetyReport Robot::makeSafe() {
  SafetyReport report;
  for (auto& [type, holder] : groups_)
    report.merge(holder->makeSafe());

  for (const auto& fault : report.faults())
    errorMonitor_->notifyFailure(fault.toString());
  if (report.ok())
    logger_->debug("Robot", "all boards safe");
  return report;
}

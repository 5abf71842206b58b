/* @file SerialHardwareBackend.cpp
 * @brief shared serial I/O for hardware backends
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// boardlink headers
#include "backends/hardware/SerialHardwareBackend.hpp"

using namespace boardlink::backends;

SerialHardwareBackend::SerialHardwareBackend(std::unique_ptr<io::SerialChannel> channel,
                                             const io::SerialPortInfo& port,
                                             const SerialConfig& config)
    : channel_(std::move(channel)), device_(port.device), serial_(port.serialNumber),
      timeout_(config.timeout), logger_(config.logger ? config.logger : core::defaultLogger()) {
  if (!channel_)
    throw std::invalid_argument("[SerialHardwareBackend] channel is nullptr");
}

void SerialHardwareBackend::send(const std::string& bytes) {
  std::size_t written = channel_->write(bytes, timeout_);
  if (written != bytes.size())
    throw core::TransportFailure("Mismatch in command bytes written to " + device_);
}

void SerialHardwareBackend::drain() { channel_->flush(timeout_); }

std::optional<std::string> SerialHardwareBackend::tryReadLine() {
  return channel_->readLine(timeout_);
}

std::string SerialHardwareBackend::readLine() {
  auto line = channel_->readLine(timeout_);
  if (!line)
    throw core::TransportTimeout("No response from board on " + device_ +
                                 ". Is it correctly powered?");
  return *line;
}

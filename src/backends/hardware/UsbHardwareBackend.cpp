/* @file UsbHardwareBackend.cpp
 * @brief shared control-transfer helpers for USB hardware backends
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// boardlink headers
#include "backends/hardware/UsbHardwareBackend.hpp"

using namespace boardlink::backends;

UsbHardwareBackend::UsbHardwareBackend(std::unique_ptr<io::UsbDevice> device,
                                       const UsbConfig& config)
    : device_(std::move(device)), timeout_(config.timeout),
      logger_(config.logger ? config.logger : core::defaultLogger()) {
  if (!device_)
    throw std::invalid_argument("[UsbHardwareBackend] device is nullptr");
}

std::vector<std::uint8_t> UsbHardwareBackend::read(const protocols::ReadCommand& command) {
  auto data = device_->controlRead(io::kRequestTypeIn, protocols::kBoardRequest, 0, command.code,
                                   command.dataLength, timeout_);
  if (data.size() < command.dataLength)
    throw core::TransportFailure("short read for command " + std::to_string(command.code) +
                                 ": expected " + std::to_string(command.dataLength) +
                                 " bytes, got " + std::to_string(data.size()));
  return data;
}

void UsbHardwareBackend::write(const protocols::WriteCommand& command, std::uint16_t value) {
  device_->controlWrite(io::kRequestTypeOut, protocols::kBoardRequest, value, command.code, {},
                        timeout_);
}

void UsbHardwareBackend::write(const protocols::WriteCommand& command,
                               const std::vector<std::uint8_t>& data) {
  device_->controlWrite(io::kRequestTypeOut, protocols::kBoardRequest, 0, command.code, data,
                        timeout_);
}

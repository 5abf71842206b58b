#pragma once
/** @file  Environments.hpp
 *  @brief The stock hardware and console environments.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <memory>

// boardlink headers
#include "backends/Environment.hpp"
#include "backends/hardware/SerialHardwareBackend.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "io/SerialPortEnumerator.hpp"
#include "io/UsbDevice.hpp"

namespace boardlink::backends {

  /// OS access used by the hardware environment; replaced by fakes in tests.
  struct HardwareTransports {
    std::shared_ptr<const io::SerialPortEnumerator> serialPorts{
      std::make_shared<io::SysfsSerialPortEnumerator>()
    };
    SerialChannelFactory channelFactory{ [] { return std::make_unique<io::SerialChannel>(); } };
    std::shared_ptr<const io::UsbContext> usb{ std::make_shared<io::UsbfsContext>() };
  };

  /// Motor board, servo board, power board and Ruggeduino on real hardware, with the
  /// timeouts from \p config.
  Environment makeHardwareEnvironment(const core::RuntimeConfig& config,
                                      std::shared_ptr<core::Logger> logger = core::defaultLogger(),
                                      HardwareTransports transports = {});

  /// The same boards simulated on \p out / \p in, one per `config.consoleSerials` entry.
  Environment makeConsoleEnvironment(const core::RuntimeConfig& config,
                                     std::ostream& out = std::cout, std::istream& in = std::cin);

  /// Picks the environment named by `config.environment`.
  Environment makeEnvironment(const core::RuntimeConfig& config,
                              std::shared_ptr<core::Logger> logger = core::defaultLogger());

} // namespace boardlink::backends

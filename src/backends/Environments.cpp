/* @file Environments.cpp
 * @brief stock environment assembly
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// boardlink headers
#include "backends/Environments.hpp"
#include "backends/console/MotorBoardConsoleBackend.hpp"
#include "backends/console/PowerBoardConsoleBackend.hpp"
#include "backends/console/RuggeduinoConsoleBackend.hpp"
#include "backends/console/ServoBoardConsoleBackend.hpp"
#include "backends/hardware/MotorBoardHardwareBackend.hpp"
#include "backends/hardware/PowerBoardHardwareBackend.hpp"
#include "backends/hardware/RuggeduinoHardwareBackend.hpp"
#include "backends/hardware/ServoBoardHardwareBackend.hpp"

namespace boardlink::backends {

  Environment makeHardwareEnvironment(const core::RuntimeConfig& config,
                                      std::shared_ptr<core::Logger> logger,
                                      HardwareTransports transports) {
    SerialConfig serial;
    serial.enumerator = std::move(transports.serialPorts);
    serial.channelFactory = std::move(transports.channelFactory);
    serial.timeout = config.serialTimeout;
    serial.logger = logger;

    UsbConfig usb;
    usb.context = std::move(transports.usb);
    usb.timeout = config.usbTimeout;
    usb.logger = logger;

    PowerBoardConfig power;
    power.usb = usb;
    power.serial = serial;

    Environment env("HardwareEnvironment");
    env.registerBackend<MotorBoardHardwareBackend>(serial)
        .registerBackend<RuggeduinoHardwareBackend>(serial)
        .registerBackend<ServoBoardHardwareBackend>(usb)
        .registerBackend<PowerBoardHardwareBackend>(power);
    return env;
  }

  Environment makeConsoleEnvironment(const core::RuntimeConfig& config, std::ostream& out,
                                     std::istream& in) {
    ConsoleConfig console;
    console.serialNumbers = config.consoleSerials;
    console.out = &out;
    console.in = &in;

    Environment env("ConsoleEnvironment");
    env.registerBackend<MotorBoardConsoleBackend>(console)
        .registerBackend<ServoBoardConsoleBackend>(console)
        .registerBackend<PowerBoardConsoleBackend>(console)
        .registerBackend<RuggeduinoConsoleBackend>(console);
    return env;
  }

  Environment makeEnvironment(const core::RuntimeConfig& config,
                              std::shared_ptr<core::Logger> logger) {
    if (config.environment == "console")
      return makeConsoleEnvironment(config);
    if (config.environment == "hardware")
      return makeHardwareEnvironment(config, std::move(logger));
    throw std::runtime_error("unknown environment: " + config.environment);
  }

} // namespace boardlink::backends

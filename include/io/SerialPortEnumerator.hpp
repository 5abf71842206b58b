#pragma once
/** @file  SerialPortEnumerator.hpp
 *  @brief Lists USB serial ports together with their USB identity.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace boardlink {
  namespace io {

    struct SerialPortInfo {
      std::string device; ///< e.g. /dev/ttyUSB0
      std::optional<std::uint16_t> vid;
      std::optional<std::uint16_t> pid;
      std::string serialNumber;
      std::string manufacturer;
      std::string product;
    };

    /**
 * @class SerialPortEnumerator
 * @brief Abstract port lister so discovery can run against fakes in tests.
 */
    class SerialPortEnumerator {
    public:
      virtual ~SerialPortEnumerator() = default;

      /// Ports sorted by device path.
      virtual std::vector<SerialPortInfo> enumerate() const = 0;
    };

    /**
 * @class SysfsSerialPortEnumerator
 * @brief Walks `<sysRoot>/class/tty/<name>/device` up to the USB device node and
 *        reads idVendor, idProduct, serial, manufacturer and product from it.
 *
 *  * ttys without a `device` link (virtual consoles, ptys) are ignored.
 *  * Non-USB ttys are listed with empty USB identity.
 */
    class SysfsSerialPortEnumerator : public SerialPortEnumerator {
    public:
      explicit SysfsSerialPortEnumerator(std::string sysRoot = "/sys",
                                         std::string devRoot = "/dev");

      std::vector<SerialPortInfo> enumerate() const override;

    private:
      std::string sysRoot_;
      std::string devRoot_;
    };

  } // namespace io
} // namespace boardlink

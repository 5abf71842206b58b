#pragma once
/** @file  UsbDevice.hpp
 *  @brief USB enumeration and control-transfer wrapper over Linux usbfs.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace boardlink {
  namespace io {

    struct UsbDeviceInfo {
      int busNumber{ 0 };
      int deviceAddress{ 0 };
      std::uint16_t vid{ 0 };
      std::uint16_t pid{ 0 };
      std::string serialNumber;
      std::string manufacturer;
      std::string product;
      int numInterfaces{ 0 }; ///< interfaces of the active configuration
      std::string devicePath; ///< e.g. /dev/bus/usb/001/004
    };

    /// Standard bmRequestType values for vendor control transfers to the device.
    constexpr std::uint8_t kRequestTypeIn = 0x80;
    constexpr std::uint8_t kRequestTypeOut = 0x00;

    /**
 * @class UsbDevice
 * @brief One opened USB device handle; control transfers only.
 *
 *  * ETIMEDOUT raises `core::TransportTimeout`, anything else `core::TransportFailure`
 *    carrying the errno (EPIPE for a stalled endpoint).
 */
    class UsbDevice {
    public:
      virtual ~UsbDevice() = default;

      virtual const UsbDeviceInfo& info() const = 0;

      virtual std::vector<std::uint8_t> controlRead(std::uint8_t requestType,
                                                    std::uint8_t request, std::uint16_t value,
                                                    std::uint16_t index, std::uint16_t length,
                                                    std::chrono::milliseconds timeout) = 0;

      virtual void controlWrite(std::uint8_t requestType, std::uint8_t request,
                                std::uint16_t value, std::uint16_t index,
                                const std::vector<std::uint8_t>& data,
                                std::chrono::milliseconds timeout) = 0;
    };

    /**
 * @class UsbContext
 * @brief Abstract device lister/opener so discovery can run against fakes in tests.
 */
    class UsbContext {
    public:
      virtual ~UsbContext() = default;

      /// Devices matching \p vid / \p pid, sorted by bus then address.
      virtual std::vector<UsbDeviceInfo> enumerate(std::uint16_t vid, std::uint16_t pid) const = 0;

      /// Throws `core::DeviceBusy` when another handle holds the device.
      virtual std::unique_ptr<UsbDevice> open(const UsbDeviceInfo& info) const = 0;
    };

    /**
 * @class UsbfsContext
 * @brief Reads `<sysRoot>/bus/usb/devices` and opens `<devRoot>/bus/usb/BBB/DDD`.
 */
    class UsbfsContext : public UsbContext {
    public:
      explicit UsbfsContext(std::string sysRoot = "/sys", std::string devRoot = "/dev");

      std::vector<UsbDeviceInfo> enumerate(std::uint16_t vid, std::uint16_t pid) const override;
      std::unique_ptr<UsbDevice> open(const UsbDeviceInfo& info) const override;

    private:
      std::string sysRoot_;
      std::string devRoot_;
    };

    /**
 * @class UsbfsDevice
 * @brief RAII owner of a usbfs fd, issuing `USBDEVFS_CONTROL` ioctls.
 *
 *  * Holds an exclusive `flock` on the node for its lifetime.
 *  * *Non-copyable*, non-movable (owned through unique_ptr).
 */
    class UsbfsDevice : public UsbDevice {
    public:
      explicit UsbfsDevice(UsbDeviceInfo info);
      ~UsbfsDevice() override;

      const UsbDeviceInfo& info() const override { return info_; }

      std::vector<std::uint8_t> controlRead(std::uint8_t requestType, std::uint8_t request,
                                            std::uint16_t value, std::uint16_t index,
                                            std::uint16_t length,
                                            std::chrono::milliseconds timeout) override;

      void controlWrite(std::uint8_t requestType, std::uint8_t request, std::uint16_t value,
                        std::uint16_t index, const std::vector<std::uint8_t>& data,
                        std::chrono::milliseconds timeout) override;

      UsbfsDevice(const UsbfsDevice&) = delete;
      UsbfsDevice& operator=(const UsbfsDevice&) = delete;

    private:
      int transfer(std::uint8_t requestType, std::uint8_t request, std::uint16_t value,
                   std::uint16_t index, std::uint16_t length, void* data,
                   std::chrono::milliseconds timeout);

      UsbDeviceInfo info_;
      int fd_{ -1 };
    };

  } // namespace io
} // namespace boardlink

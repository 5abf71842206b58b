/* @file UsbDevice.cpp
 * @brief usbfs enumeration through sysfs and control transfers through ioctl
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <linux/usbdevice_fs.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <unistd.h>

// boardlink headers
#include "core/Errors.hpp"
#include "io/Sysfs.hpp"
#include "io/UsbDevice.hpp"

using namespace boardlink::io;
using boardlink::core::DeviceBusy;
using boardlink::core::TransportFailure;
using boardlink::core::TransportTimeout;
namespace fs = std::filesystem;

namespace {

  std::string nodePath(const std::string& devRoot, int bus, int address) {
    char name[16];
    std::snprintf(name, sizeof(name), "%03d/%03d", bus, address);
    return (fs::path(devRoot) / "bus" / "usb" / name).string();
  }

} // namespace

//---UsbfsContext---------------------------------------------------------

UsbfsContext::UsbfsContext(std::string sysRoot, std::string devRoot)
    : sysRoot_(std::move(sysRoot)), devRoot_(std::move(devRoot)) {}

std::vector<UsbDeviceInfo> UsbfsContext::enumerate(std::uint16_t vid, std::uint16_t pid) const {
  std::vector<UsbDeviceInfo> devices;

  const fs::path root = fs::path(sysRoot_) / "bus" / "usb" / "devices";
  std::error_code ec;
  if (!fs::is_directory(root, ec))
    throw TransportFailure("[UsbfsContext] cannot list " + root.string());

  for (const auto& entry : fs::directory_iterator(root, ec)) {
    const fs::path dir = entry.path();
    auto devVid = sysfs::readHexAttribute(dir / "idVendor");
    auto devPid = sysfs::readHexAttribute(dir / "idProduct");
    if (!devVid || !devPid || *devVid != vid || *devPid != pid)
      continue; // interfaces and other vendors

    auto bus = sysfs::readIntAttribute(dir / "busnum");
    auto address = sysfs::readIntAttribute(dir / "devnum");
    if (!bus || !address)
      continue;

    UsbDeviceInfo info;
    info.busNumber = *bus;
    info.deviceAddress = *address;
    info.vid = *devVid;
    info.pid = *devPid;
    info.serialNumber = sysfs::readAttribute(dir / "serial").value_or("");
    info.manufacturer = sysfs::readAttribute(dir / "manufacturer").value_or("");
    info.product = sysfs::readAttribute(dir / "product").value_or("");
    info.numInterfaces = sysfs::readIntAttribute(dir / "bNumInterfaces").value_or(0);
    info.devicePath = nodePath(devRoot_, info.busNumber, info.deviceAddress);
    devices.push_back(std::move(info));
  }

  std::sort(devices.begin(), devices.end(), [](const UsbDeviceInfo& a, const UsbDeviceInfo& b) {
    return std::pair(a.busNumber, a.deviceAddress) < std::pair(b.busNumber, b.deviceAddress);
  });
  return devices;
}

std::unique_ptr<UsbDevice> UsbfsContext::open(const UsbDeviceInfo& info) const {
  return std::make_unique<UsbfsDevice>(info);
}

//---UsbfsDevice----------------------------------------------------------

UsbfsDevice::UsbfsDevice(UsbDeviceInfo info) : info_(std::move(info)) {
  fd_ = ::open(info_.devicePath.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0)
    throw TransportFailure("[UsbfsDevice] open " + info_.devicePath + ": " + std::strerror(errno),
                           errno);

  if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    if (err == EWOULDBLOCK)
      throw DeviceBusy("[UsbfsDevice] " + info_.devicePath + " is already claimed", err);
    throw TransportFailure("[UsbfsDevice] flock " + info_.devicePath + ": " + std::strerror(err),
                           err);
  }
}

UsbfsDevice::~UsbfsDevice() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

int UsbfsDevice::transfer(std::uint8_t requestType, std::uint8_t request, std::uint16_t value,
                          std::uint16_t index, std::uint16_t length, void* data,
                          std::chrono::milliseconds timeout) {
  usbdevfs_ctrltransfer ctrl{};
  ctrl.bRequestType = requestType;
  ctrl.bRequest = request;
  ctrl.wValue = value;
  ctrl.wIndex = index;
  ctrl.wLength = length;
  ctrl.timeout = static_cast<__u32>(timeout.count());
  ctrl.data = data;

  int rc;
  do {
    rc = ::ioctl(fd_, USBDEVFS_CONTROL, &ctrl);
  } while (rc < 0 && errno == EINTR);

  if (rc < 0) {
    const int err = errno;
    const std::string msg = "[UsbfsDevice] control transfer to " + info_.devicePath + " (index " +
                            std::to_string(index) + "): " + std::strerror(err);
    if (err == ETIMEDOUT)
      throw TransportTimeout(msg);
    throw TransportFailure(msg, err);
  }
  return rc;
}

std::vector<std::uint8_t> UsbfsDevice::controlRead(std::uint8_t requestType, std::uint8_t request,
                                                   std::uint16_t value, std::uint16_t index,
                                                   std::uint16_t length,
                                                   std::chrono::milliseconds timeout) {
  std::vector<std::uint8_t> buffer(length);
  int n = transfer(requestType, request, value, index, length, buffer.data(), timeout);
  buffer.resize(static_cast<std::size_t>(n));
  return buffer;
}

void UsbfsDevice::controlWrite(std::uint8_t requestType, std::uint8_t request,
                               std::uint16_t value, std::uint16_t index,
                               const std::vector<std::uint8_t>& data,
                               std::chrono::milliseconds timeout) {
  std::vector<std::uint8_t> buffer(data); // ioctl takes a non-const pointer
  transfer(requestType, request, value, index, static_cast<std::uint16_t>(buffer.size()),
           buffer.empty() ? nullptr : buffer.data(), timeout);
}

/* @file SerialPortEnumerator.cpp
 * @brief sysfs-backed serial port discovery
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

// boardlink headers
#include "io/SerialPortEnumerator.hpp"
#include "io/Sysfs.hpp"

using namespace boardlink::io;
namespace fs = std::filesystem;

namespace {

  // interface dir -> device dir is at most a few hops (ttyUSB adds one more)
  constexpr int kMaxUsbHops = 4;

  std::optional<fs::path> findUsbDevice(const fs::path& start) {
    fs::path dir = start;
    for (int hop = 0; hop < kMaxUsbHops && !dir.empty(); ++hop) {
      std::error_code ec;
      if (fs::exists(dir / "idVendor", ec))
        return dir;
      if (dir == dir.parent_path())
        break;
      dir = dir.parent_path();
    }
    return std::nullopt;
  }

} // namespace

SysfsSerialPortEnumerator::SysfsSerialPortEnumerator(std::string sysRoot, std::string devRoot)
    : sysRoot_(std::move(sysRoot)), devRoot_(std::move(devRoot)) {}

std::vector<SerialPortInfo> SysfsSerialPortEnumerator::enumerate() const {
  std::vector<SerialPortInfo> ports;

  const fs::path ttyClass = fs::path(sysRoot_) / "class" / "tty";
  std::error_code ec;
  if (!fs::is_directory(ttyClass, ec))
    return ports;

  for (const auto& entry : fs::directory_iterator(ttyClass, ec)) {
    const fs::path deviceLink = entry.path() / "device";
    if (!fs::exists(deviceLink, ec))
      continue;

    fs::path device = fs::canonical(deviceLink, ec);
    if (ec) {
      ec.clear();
      continue;
    }

    SerialPortInfo info;
    info.device = (fs::path(devRoot_) / entry.path().filename()).string();

    if (auto usb = findUsbDevice(device)) {
      info.vid = sysfs::readHexAttribute(*usb / "idVendor");
      info.pid = sysfs::readHexAttribute(*usb / "idProduct");
      info.serialNumber = sysfs::readAttribute(*usb / "serial").value_or("");
      info.manufacturer = sysfs::readAttribute(*usb / "manufacturer").value_or("");
      info.product = sysfs::readAttribute(*usb / "product").value_or("");
    }
    ports.push_back(std::move(info));
  }

  std::sort(ports.begin(), ports.end(),
            [](const SerialPortInfo& a, const SerialPortInfo& b) { return a.device < b.device; });
  return ports;
}

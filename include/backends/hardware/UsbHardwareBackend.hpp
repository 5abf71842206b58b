#pragma once
/** @file  UsbHardwareBackend.hpp
 *  @brief Base for backends that drive a board through USB control transfers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// boardlink headers
#include "backends/Backend.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/UsbDevice.hpp"
#include "protocols/UsbCommand.hpp"

namespace boardlink::backends {

  /// Discovery options shared by the USB backends.
  struct UsbConfig {
    std::shared_ptr<const io::UsbContext> context{ std::make_shared<io::UsbfsContext>() };
    std::chrono::milliseconds timeout{ 1000 };
    std::shared_ptr<core::Logger> logger{ core::defaultLogger() };
  };

  /**
 * @class UsbHardwareBackend
 * @brief Owns one opened `io::UsbDevice` and the mutex that serializes it.
 *
 *  * Every transfer uses `protocols::kBoardRequest` with the command code in wIndex.
 *  * Derived classes lock `mutex()` in every public entry point.
 */
  class UsbHardwareBackend : public Backend {
  public:
    std::string serialNumber() override { return device_->info().serialNumber; }

  protected:
    UsbHardwareBackend(std::unique_ptr<io::UsbDevice> device, const UsbConfig& config);

    /// @throws core::TransportFailure when the board returns fewer bytes than expected.
    std::vector<std::uint8_t> read(const protocols::ReadCommand& command);

    /// Parameter travels in wValue.
    void write(const protocols::WriteCommand& command, std::uint16_t value);

    /// Parameter travels in the data stage.
    void write(const protocols::WriteCommand& command, const std::vector<std::uint8_t>& data);

    std::mutex& mutex() { return mtx_; }
    io::UsbDevice& device() { return *device_; }
    core::Logger& logger() { return *logger_; }

    /// Opens every matching device accepted by \p accept and builds a board for each
    /// one whose backend constructor succeeds. Candidates failing with a
    /// `CommunicationError` are logged and skipped.
    template <typename BackendT, typename Config, typename Accept>
    static std::vector<std::unique_ptr<typename BackendT::BoardType>>
    discoverDevices(const Config& config, std::uint16_t vid, std::uint16_t pid, Accept accept) {
      std::vector<std::unique_ptr<typename BackendT::BoardType>> boards;
      for (const io::UsbDeviceInfo& info : config.context->enumerate(vid, pid)) {
        if (!accept(info))
          continue;
        try {
          boards.push_back(std::make_unique<typename BackendT::BoardType>(
              std::make_unique<BackendT>(config.context->open(info), config)));
        } catch (const core::CommunicationError& e) {
          config.logger->warning(BackendT::kName,
                                 "skipping " + info.devicePath + ": " + e.what());
        }
      }
      return boards;
    }

  private:
    std::mutex mtx_;
    std::unique_ptr<io::UsbDevice> device_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<core::Logger> logger_;
  };

} // namespace boardlink::backends

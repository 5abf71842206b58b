#pragma once
/** @file  SerialHardwareBackend.hpp
 *  @brief Base for backends that talk to a board over a USB serial port.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// boardlink headers
#include "backends/Backend.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/SerialChannel.hpp"
#include "io/SerialPortEnumerator.hpp"

namespace boardlink::backends {

  using SerialChannelFactory = std::function<std::unique_ptr<io::SerialChannel>()>;

  /// Discovery options shared by the serial backends.
  struct SerialConfig {
    std::shared_ptr<const io::SerialPortEnumerator> enumerator{
      std::make_shared<io::SysfsSerialPortEnumerator>()
    };
    SerialChannelFactory channelFactory{ [] { return std::make_unique<io::SerialChannel>(); } };
    std::chrono::milliseconds timeout{ 250 };
    std::shared_ptr<core::Logger> logger{ core::defaultLogger() };
  };

  /**
 * @class SerialHardwareBackend
 * @brief Owns one opened `io::SerialChannel` and the mutex that serializes it.
 *
 *  * Derived classes lock `mutex()` in every public entry point and call the
 *    unlocked helpers below.
 *  * The serial number comes from the USB descriptor found at discovery.
 */
  class SerialHardwareBackend : public Backend {
  public:
    std::string serialNumber() override { return serial_; }

    const std::string& device() const { return device_; }

  protected:
    SerialHardwareBackend(std::unique_ptr<io::SerialChannel> channel, const io::SerialPortInfo& port,
                          const SerialConfig& config);

    /// Writes all of \p bytes. @throws core::TransportFailure on a short write.
    void send(const std::string& bytes);

    /// Waits for queued output to reach the device. @throws core::TransportTimeout
    void drain();

    /// One line; nullopt when the timeout expires with nothing received.
    std::optional<std::string> tryReadLine();

    /// One line. @throws core::TransportTimeout when nothing arrives in time.
    std::string readLine();

    std::mutex& mutex() { return mtx_; }
    core::Logger& logger() { return *logger_; }

    /// Opens every port accepted by \p matches and builds a board for each one that
    /// passes the backend's handshake. Candidates failing with a `CommunicationError`
    /// are logged and skipped.
    template <typename BackendT, typename Config, typename Predicate>
    static std::vector<std::unique_ptr<typename BackendT::BoardType>>
    discoverPorts(const Config& config, unsigned int baud, Predicate matches) {
      std::vector<std::unique_ptr<typename BackendT::BoardType>> boards;
      const speed_t speed = io::toSpeed(baud);
      for (const io::SerialPortInfo& port : config.enumerator->enumerate()) {
        if (!matches(port))
          continue;
        try {
          auto channel = config.channelFactory();
          channel->open(port.device, speed);
          boards.push_back(std::make_unique<typename BackendT::BoardType>(
              std::make_unique<BackendT>(std::move(channel), port, config)));
        } catch (const core::CommunicationError& e) {
          config.logger->warning(BackendT::kName, "skipping " + port.device + ": " + e.what());
        }
      }
      return boards;
    }

  private:
    std::mutex mtx_;
    std::unique_ptr<io::SerialChannel> channel_;
    std::string device_;
    std::string serial_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<core::Logger> logger_;
  };

} // namespace boardlink::backends

#pragma once
/** @file  ConsoleBackend.hpp
 *  @brief Shared state of the console backends.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "backends/Backend.hpp"
#include "backends/console/Console.hpp"

namespace boardlink::backends {

  /// Options shared by every console backend.
  struct ConsoleConfig {
    /// One simulated board per entry.
    std::vector<std::string> serialNumbers{ "SERIAL" };
    std::ostream* out{ &std::cout };
    std::istream* in{ &std::cin };
  };

  /**
 * @class ConsoleBackend
 * @brief A simulated board: remembers what was written, prints every change and
 *        asks the user for anything only hardware could measure.
 */
  class ConsoleBackend : public Backend {
  public:
    /// \p boardClass names the board in every line, e.g. "MotorBoard".
    /// @throws std::invalid_argument when either console stream is nullptr.
    ConsoleBackend(const std::string& boardClass, std::string serial, const ConsoleConfig& config)
        : serial_(std::move(serial)),
          console_(boardClass + "(" + serial_ + ")", stream(config.out, "out"),
                   stream(config.in, "in")) {}

    std::string serialNumber() override { return serial_; }
    std::optional<std::string> firmwareVersion() override { return std::nullopt; }

  protected:
    Console& console() { return console_; }

    /// Builds one board per configured serial number.
    template <typename BackendT, typename... BoardArgs>
    static std::vector<std::unique_ptr<typename BackendT::BoardType>>
    discoverEach(const typename BackendT::Config& config, const BoardArgs&... boardArgs) {
      std::vector<std::unique_ptr<typename BackendT::BoardType>> boards;
      for (const auto& serial : config.serialNumbers)
        boards.push_back(std::make_unique<typename BackendT::BoardType>(
            std::make_unique<BackendT>(serial, config), boardArgs...));
      return boards;
    }

  private:
    template <typename Stream> static Stream& stream(Stream* s, const char* name) {
      if (!s)
        throw std::invalid_argument(std::string("[ConsoleBackend] ") + name + " stream is nullptr");
      return *s;
    }

    std::string serial_;
    Console console_;
  };

} // namespace boardlink::backends

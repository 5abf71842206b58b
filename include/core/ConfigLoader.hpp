#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/Logger.hpp"

namespace boardlink::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * Nothing is cached; every `load()` reads the file again.
 *  * Schema mapping lives in `RuntimeConfig::fromJson`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

  /// Typed view of the configuration file; every field has a default.
  struct RuntimeConfig {
    std::string environment{ "hardware" }; ///< "hardware" or "console"
    LogLevel logLevel{ LogLevel::Info };
    std::string logFile{};                 ///< empty = stderr only
    std::chrono::milliseconds serialTimeout{ 250 };
    std::chrono::milliseconds usbTimeout{ 1000 };
    std::vector<std::string> consoleSerials{ "SERIAL" };

    /// Missing keys keep their defaults; wrong types or values throw `std::runtime_error`.
    static RuntimeConfig fromJson(const nlohmann::json& doc);

    /// Applies level and log file to \p logger.
    void applyTo(Logger& logger) const;
  };

} // namespace boardlink::core

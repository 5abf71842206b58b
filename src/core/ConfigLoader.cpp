/* @file ConfigLoader.cpp
 * @brief JSON config file loading and mapping to RuntimeConfig
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// boardlink headers
#include "core/ConfigLoader.hpp"

using namespace boardlink::core;

namespace {

  std::chrono::milliseconds readTimeout(const nlohmann::json& section, const char* name) {
    const auto& value = section.at("timeout_ms");
    if (!value.is_number_integer() || value.get<long long>() <= 0)
      throw std::runtime_error(std::string("[ConfigLoader] ") + name +
                               ".timeout_ms must be a positive integer");
    return std::chrono::milliseconds(value.get<long long>());
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] malformed config file " + path_ + ": " + e.what());
  }
}

RuntimeConfig RuntimeConfig::fromJson(const nlohmann::json& doc) {
  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] config root must be an object");

  RuntimeConfig cfg;
  try {
    if (doc.contains("environment")) {
      cfg.environment = doc.at("environment").get<std::string>();
      if (cfg.environment != "hardware" && cfg.environment != "console")
        throw std::runtime_error("[ConfigLoader] unknown environment: " + cfg.environment);
    }

    if (doc.contains("logging")) {
      const auto& logging = doc.at("logging");
      if (logging.contains("level")) {
        const auto text = logging.at("level").get<std::string>();
        auto level = parseLogLevel(text);
        if (!level)
          throw std::runtime_error("[ConfigLoader] unknown log level: " + text);
        cfg.logLevel = *level;
      }
      if (logging.contains("file"))
        cfg.logFile = logging.at("file").get<std::string>();
    }

    if (doc.contains("serial") && doc.at("serial").contains("timeout_ms"))
      cfg.serialTimeout = readTimeout(doc.at("serial"), "serial");

    if (doc.contains("usb") && doc.at("usb").contains("timeout_ms"))
      cfg.usbTimeout = readTimeout(doc.at("usb"), "usb");

    if (doc.contains("console") && doc.at("console").contains("serials")) {
      cfg.consoleSerials = doc.at("console").at("serials").get<std::vector<std::string>>();
      if (cfg.consoleSerials.empty())
        throw std::runtime_error("[ConfigLoader] console.serials must not be empty");
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("[ConfigLoader] bad config value: ") + e.what());
  }
  return cfg;
}

void RuntimeConfig::applyTo(Logger& logger) const {
  logger.setThreshold(logLevel);
  if (!logFile.empty() && !logger.attachFile(logFile))
    throw std::runtime_error("[ConfigLoader] cannot open log file: " + logFile);
}

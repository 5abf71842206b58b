/* @file Logger.cpp
 * @brief CSV log formatting and sinks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// boardlink headers
#include "core/Logger.hpp"

using namespace boardlink::core;

namespace {

  std::string csvField(std::string_view field) {
    if (field.find_first_of(",\"\n") == std::string_view::npos)
      return std::string(field);

    std::string quoted = "\"";
    for (char c : field) {
      if (c == '"')
        quoted += '"'; // RFC 4180 escaping
      quoted += c;
    }
    quoted += '"';
    return quoted;
  }

} // namespace

const char* boardlink::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> boardlink::core::parseLogLevel(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warning" || lower == "warn")
    return LogLevel::Warning;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "off")
    return LogLevel::Off;
  return std::nullopt;
}

std::string LogEvent::toCsv() const {
  const std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      timestamp.time_since_epoch()) %
                  1000;

  std::tm utc{};
  gmtime_r(&t, &utc);

  std::ostringstream line;
  line << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms.count() << 'Z' << ',' << toString(level) << ',' << csvField(source) << ','
       << csvField(message) << '\n';
  return line.str();
}

Logger::Logger(std::ostream& out, LogLevel threshold) : out_(&out), threshold_(threshold) {}

Logger::~Logger() { flush(); }

void Logger::log(LogLevel level, std::string_view source, std::string_view message) {
  if (level == LogLevel::Off)
    return;
  {
    std::lock_guard lock(mtx_);
    if (level < threshold_)
      return;
  }
  log(LogEvent{ std::chrono::system_clock::now(), level, std::string(source),
                std::string(message) });
}

void Logger::log(const LogEvent& event) {
  std::lock_guard lock(mtx_);
  if (event.level < threshold_ || event.level == LogLevel::Off)
    return;

  const std::string line = event.toCsv();
  *out_ << line;
  if (file_.isOpen())
    file_.write(line);
}

void Logger::setThreshold(LogLevel level) {
  std::lock_guard lock(mtx_);
  threshold_ = level;
}

LogLevel Logger::threshold() const {
  std::lock_guard lock(mtx_);
  return threshold_;
}

bool Logger::attachFile(const std::string& path) {
  std::lock_guard lock(mtx_);
  return file_.open(path);
}

void Logger::flush() {
  std::lock_guard lock(mtx_);
  out_->flush();
  if (file_.isOpen())
    file_.flush();
}

std::shared_ptr<Logger> boardlink::core::defaultLogger() {
  static const auto logger = std::make_shared<Logger>(std::cerr);
  return logger;
}

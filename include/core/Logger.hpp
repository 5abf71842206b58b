#pragma once
/** @file  Logger.hpp
 *  @brief Levelled CSV logger shared by backends, discovery and the safety path.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "io/FileLogger.hpp"

namespace boardlink {
  namespace core {

    enum class LogLevel { Debug, Info, Warning, Error, Off };

    const char* toString(LogLevel level);

    /// Parses "debug", "info", "warning", "error" or "off" (case-insensitive).
    std::optional<LogLevel> parseLogLevel(std::string_view text);

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp;
      LogLevel level;
      std::string source;
      std::string message;

      /// `timestamp,level,source,message` with the message quoted when needed.
      std::string toCsv() const;
    };

    /**
 * @class Logger
 * @brief Formats `LogEvent`s as CSV lines and writes them to a stream and,
 *        optionally, a `FileLogger`.
 *
 *  * Thread-safe: one mutex guards both sinks.
 *  * Events below the threshold are dropped before formatting.
 */
    class Logger {

    public:
      explicit Logger(std::ostream& out, LogLevel threshold = LogLevel::Info);
      ~Logger();

      // --- public API ---
      void log(LogLevel level, std::string_view source, std::string_view message);
      void log(const LogEvent& event);

      void debug(std::string_view source, std::string_view message) {
        log(LogLevel::Debug, source, message);
      }
      void info(std::string_view source, std::string_view message) {
        log(LogLevel::Info, source, message);
      }
      void warning(std::string_view source, std::string_view message) {
        log(LogLevel::Warning, source, message);
      }
      void error(std::string_view source, std::string_view message) {
        log(LogLevel::Error, source, message);
      }

      void setThreshold(LogLevel level);
      LogLevel threshold() const;

      /// Mirror every event into \p path as well. @returns false if it cannot be opened.
      bool attachFile(const std::string& path);
      void flush();

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      mutable std::mutex mtx_;
      std::ostream* out_;
      LogLevel threshold_;
      io::FileLogger file_;
    };

    /// Process-wide logger on std::cerr, used when nothing else is injected.
    std::shared_ptr<Logger> defaultLogger();

  } // namespace core
} // namespace boardlink

#pragma once
/** @file  FileLogger.hpp
 *  @brief Append-only file sink behind `core::Logger::attachFile()`.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace boardlink {
  namespace io {

    /**
 * @class FileLogger
 * @brief Owns the `FILE*` a Logger mirrors its CSV events into.
 *
 *  * Opened in append mode so several robot runs share one log file.
 *  * Events are held in memory until the buffer passes `kFlushThreshold`, then
 *    written with `std::fwrite`; the destructor flushes whatever is left.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kFlushThreshold = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      /** @returns false if \p path cannot be opened for appending. */
      bool open(const std::string& path);

      /// Queues one already formatted event line.
      void write(const std::string& line);

      /// Writes the buffer out and fflush()es; false when the disk write fails.
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      std::FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace boardlink

#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART byte/line I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace boardlink {
  namespace io {

    /// Maps a numeric baud rate to its termios constant; throws `core::InvalidArgument`.
    speed_t toSpeed(unsigned int baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Takes an exclusive `flock` on open; a port held elsewhere raises `core::DeviceBusy`.
 *  * Lines are split on `\n`, a trailing `\r` is stripped.
 *  * Errors raise `core::TransportFailure`; read timeouts return empty results so callers
 *    decide whether silence is an error.
 *  * A write that cannot drain within its timeout raises `core::TransportTimeout`.
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual void open(const std::string& dev, speed_t baud);
      virtual std::size_t write(const std::string& bytes, std::chrono::milliseconds timeout);
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      /// Reads up to \p size bytes; returns fewer if \p timeout expires first.
      virtual std::string read(std::size_t size, std::chrono::milliseconds timeout);
      /// Waits until queued output has been sent; `core::TransportTimeout` if it has not
      /// drained within \p timeout.
      virtual void flush(std::chrono::milliseconds timeout);
      virtual void close();
      virtual bool isOpen() const { return fd_ >= 0; }

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      /// Waits for input and appends it to rx_buffer_; false on timeout.
      bool fill(std::chrono::steady_clock::time_point deadline);
      /// Waits for room in the output queue; false on timeout.
      bool waitWritable(std::chrono::steady_clock::time_point deadline);

      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string dev_{};
      std::string rx_buffer_{}; ///< bytes received but not yet returned
    };
  } // namespace io
} // namespace boardlink

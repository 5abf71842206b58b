/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx/ttyACMx - handles file descriptor, locking, framing and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <string>
#include <thread>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <sys/file.h>  // flock
#include <sys/ioctl.h> // TIOCOUTQ
#include <unistd.h>   // write(), read(), close()

// boardlink headers
#include "core/Errors.hpp"
#include "io/SerialChannel.hpp"

using namespace boardlink::io;
using boardlink::core::DeviceBusy;
using boardlink::core::TransportFailure;
using boardlink::core::TransportTimeout;

namespace {

  std::string errnoMessage(const char* what, const std::string& dev) {
    return std::string("[SerialChannel] ") + what + " " + dev + ": " + std::strerror(errno);
  }

} // namespace

speed_t boardlink::io::toSpeed(unsigned int baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  case 460800:
    return B460800;
  case 500000:
    return B500000;
  case 921600:
    return B921600;
  case 1000000:
    return B1000000;
  default:
    throw core::InvalidArgument("[SerialChannel] unsupported baud rate: " + std::to_string(baud));
  }
}

SerialChannel::~SerialChannel() { SerialChannel::close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), dev_(std::move(other.dev_)),
      rx_buffer_(std::move(other.rx_buffer_)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    SerialChannel::close();
    fd_ = std::exchange(other.fd_, -1);
    dev_ = std::move(other.dev_);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

void SerialChannel::open(const std::string& dev, speed_t baud) {
  close();

  // open non-blocking, dont become ctrl-TTY
  int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    if (errno == EBUSY)
      throw DeviceBusy(errnoMessage("open", dev), errno);
    throw TransportFailure(errnoMessage("open", dev), errno);
  }

  // one owner per port
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd);
    errno = err;
    if (err == EWOULDBLOCK)
      throw DeviceBusy("[SerialChannel] " + dev + " is already claimed", err);
    throw TransportFailure(errnoMessage("flock", dev), err);
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd, &tty) != 0) {
    const int err = errno;
    ::close(fd);
    errno = err;
    throw TransportFailure(errnoMessage("tcgetattr", dev), err);
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    const int err = errno;
    ::close(fd);
    errno = err;
    throw TransportFailure(errnoMessage("tcsetattr", dev), err);
  }

  fd_ = fd;
  dev_ = dev;
  rx_buffer_.clear();
}

std::size_t SerialChannel::write(const std::string& bytes, std::chrono::milliseconds timeout) {

  if (fd_ < 0)
    throw TransportFailure("[SerialChannel] write on closed channel");

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  // Good Pattern for POSIX write loop (required if the tty blocks for instance)
  std::size_t total = 0;
  while (total < bytes.size()) {
    ssize_t written = ::write(fd_, bytes.data() + total, bytes.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!waitWritable(deadline))
        throw TransportTimeout("[SerialChannel] write to " + dev_ + " timed out after " +
                               std::to_string(total) + " of " + std::to_string(bytes.size()) +
                               " bytes");
    } else {
      throw TransportFailure(errnoMessage("write", dev_), errno);
    }
  }

  return total;
}

// -------------------------------------------------------------------
// SerialChannel::waitWritable
// Blocks until the output queue has room or the deadline passes.
// -------------------------------------------------------------------
bool SerialChannel::waitWritable(std::chrono::steady_clock::time_point deadline) {
  pollfd pfd{ fd_, POLLOUT, 0 };

  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return false;

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    int ms = static_cast<int>(ms_left.count()) + 1; // round up so we never spin at 0

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      throw TransportFailure(errnoMessage("poll", dev_), errno);
    }
    if (rc == 0)
      continue; // re-check the deadline

    if (pfd.revents & (POLLHUP | POLLERR)) {
      const std::string dev = dev_;
      close();
      throw TransportFailure("[SerialChannel] " + dev + " disconnected");
    }
    if (pfd.revents & POLLOUT)
      return true;
  }
}

// -------------------------------------------------------------------
// SerialChannel::fill
// Waits until the fd is readable or the deadline passes, then drains
// whatever is available into rx_buffer_.
// -------------------------------------------------------------------
bool SerialChannel::fill(std::chrono::steady_clock::time_point deadline) {
  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      throw TransportFailure(errnoMessage("poll", dev_), errno);
    }
    if (rc == 0)
      return false; // timeout

    if (pfd.revents & (POLLHUP | POLLERR)) {
      const std::string dev = dev_;
      close();
      throw TransportFailure("[SerialChannel] " + dev + " disconnected");
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
        return true;
      } else if (n == 0) { // EOF / disconnect
        const std::string dev = dev_;
        close();
        throw TransportFailure("[SerialChannel] " + dev + " disconnected");
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        throw TransportFailure(errnoMessage("read", dev_), errno);
      }
    }
  }
  return false;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout; partial lines stay buffered.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    throw TransportFailure("[SerialChannel] read on closed channel");

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    if (auto pos = rx_buffer_.find('\n'); pos != std::string::npos) {
      std::string line = rx_buffer_.substr(0, pos);
      rx_buffer_.erase(0, pos + 1); // remove line + LF
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      return line;
    }
    if (!fill(deadline))
      return std::nullopt; // timeout/partial
  }
}

std::string SerialChannel::read(std::size_t size, std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    throw TransportFailure("[SerialChannel] read on closed channel");

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (rx_buffer_.size() < size) {
    if (!fill(deadline))
      break;
  }

  std::string out = rx_buffer_.substr(0, size);
  rx_buffer_.erase(0, out.size());
  return out;
}

// -------------------------------------------------------------------
// SerialChannel::flush
// Waits for the output queue to empty. tcdrain() has no timeout, so
// the queue length is polled instead.
// -------------------------------------------------------------------
void SerialChannel::flush(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int pending = 0;
  while (true) {
    if (::ioctl(fd_, TIOCOUTQ, &pending) != 0)
      throw TransportFailure(errnoMessage("ioctl(TIOCOUTQ)", dev_), errno);
    if (pending <= 0)
      return;
    if (std::chrono::steady_clock::now() >= deadline)
      throw TransportTimeout("[SerialChannel] " + dev_ + " still has " + std::to_string(pending) +
                             " bytes queued");
    std::this_thread::sleep_for(std::chrono::milliseconds{ 1 });
  }
}

void SerialChannel::close() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  fd_ = -1;
  rx_buffer_.clear();
}

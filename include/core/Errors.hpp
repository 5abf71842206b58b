#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by components, boards, backends and transports.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <stdexcept>
#include <string>

namespace boardlink::core {

  /// Caller passed an out-of-range or malformed value; thrown before any backend I/O.
  class InvalidArgument : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /// No board with the requested serial number is in the group.
  class BoardNotFound : public std::out_of_range {
  public:
    explicit BoardNotFound(const std::string& serial)
        : std::out_of_range("could not find a board with the serial number " + serial),
          serial_(serial) {}

    const std::string& serial() const noexcept { return serial_; }

  private:
    std::string serial_;
  };

  /**
 * @class BoardCountError
 * @brief `singular()` was called on a group that does not hold exactly one board.
 *
 *  * `found()` tells zero-found apart from several-found.
 */
  class BoardCountError : public std::runtime_error {
  public:
    BoardCountError(const std::string& boardName, std::size_t found)
        : std::runtime_error("expected exactly one " + boardName +
                             " to be connected, but found " + std::to_string(found)),
          found_(found) {}

    std::size_t found() const noexcept { return found_; }
    bool noneFound() const noexcept { return found_ == 0; }
    bool multipleFound() const noexcept { return found_ > 1; }

  private:
    std::size_t found_;
  };

  /// Two candidates reported the same serial number during one discovery call.
  class DiscoveryAmbiguity : public std::runtime_error {
  public:
    explicit DiscoveryAmbiguity(const std::string& serial)
        : std::runtime_error("more than one board reported the serial number " + serial),
          serial_(serial) {}

    const std::string& serial() const noexcept { return serial_; }

  private:
    std::string serial_;
  };

  /// Base for every failure to talk to a board.
  class CommunicationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// A transport call did not complete within its configured timeout.
  class TransportTimeout : public CommunicationError {
  public:
    using CommunicationError::CommunicationError;
  };

  /// Device disconnected or I/O error; the owning board must be re-discovered.
  class TransportFailure : public CommunicationError {
  public:
    TransportFailure(const std::string& what, int errorNumber = 0)
        : CommunicationError(what), errno_(errorNumber) {}

    int errorNumber() const noexcept { return errno_; }

  private:
    int errno_;
  };

  /// The device is already claimed by another handle; discovery skips it.
  class DeviceBusy : public TransportFailure {
  public:
    using TransportFailure::TransportFailure;
  };

  /// The board answered but runs firmware this backend cannot drive.
  class UnsupportedFirmware : public CommunicationError {
  public:
    using CommunicationError::CommunicationError;
  };

  /// The hardware cannot do what was asked, even though the request is well formed.
  class NotSupportedByHardware : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// A GPIO operation needs the pin to be in a different mode.
  class BadGpioPinMode : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// The environment has no backend registered for the requested board.
  class NotSupportedByEnvironment : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace boardlink::core

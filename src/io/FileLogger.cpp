/* @file FileLogger.cpp
 * @brief buffered log file writer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdio>
#include <utility>

// boardlink headers
#include "io/FileLogger.hpp"

using namespace boardlink::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  return fp_ != nullptr;
}

void FileLogger::write(const std::string& csv) {
  if (!fp_)
    return;

  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kFlushThreshold)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  if (!buffer_.empty()) {
    std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_) {
    flush();
    std::fclose(fp_);
  }
  fp_ = nullptr;
  buffer_.clear();
}

#pragma once
/** @file  Console.hpp
 *  @brief Text stand-in for hardware: prints what a board would do and asks the
 *         user for what a board would measure.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "core/Errors.hpp"

namespace boardlink::backends {

  /**
 * @class Console
 * @brief Prefixes every line with a descriptor such as "MotorBoard(SERIAL)".
 *
 *  * `read<T>()` re-prompts until the reply parses as a `T`.
 *  * Running out of input is a `core::TransportFailure`.
 */
  class Console {
  public:
    Console(std::string descriptor, std::ostream& out = std::cout, std::istream& in = std::cin)
        : descriptor_(std::move(descriptor)), out_(out), in_(in) {}

    void info(const std::string& message) { out_ << descriptor_ << ": " << message << '\n'; }

    template <typename T> T read(const std::string& prompt) {
      for (;;) {
        std::string reply = ask(prompt);
        T value{};
        if (parse(reply, value))
          return value;
        info("Unable to construct a " + std::string(typeName<T>()) + " from '" + reply + "'");
      }
    }

    /// Prompts and discards the reply.
    void wait(const std::string& prompt) { ask(prompt); }

    const std::string& descriptor() const { return descriptor_; }

  private:
    std::string ask(const std::string& prompt) {
      out_ << descriptor_ << ": " << prompt << ": " << std::flush;
      std::string reply;
      if (!std::getline(in_, reply))
        throw core::TransportFailure(descriptor_ + ": console input closed");
      return reply;
    }

    static bool parse(const std::string& text, std::string& value) {
      value = text;
      return true;
    }

    /// "true"/"yes" and "false"/"no", case-insensitive, surrounding blanks ignored.
    static bool parse(const std::string& text, bool& value);

    template <typename T> static bool parse(const std::string& text, T& value) {
      static_assert(std::is_arithmetic_v<T>, "Console can only read strings, bools and numbers");
      std::istringstream stream(text);
      stream >> value;
      if (!stream)
        return false;
      stream >> std::ws;
      return stream.eof();
    }

    template <typename T> static const char* typeName() {
      if constexpr (std::is_same_v<T, bool>)
        return "bool";
      else if constexpr (std::is_integral_v<T>)
        return "int";
      else if constexpr (std::is_floating_point_v<T>)
        return "float";
      else
        return "string";
    }

    std::string descriptor_;
    std::ostream& out_;
    std::istream& in_;
  };

} // namespace boardlink::backends

/* @file StringCommand.cpp
 * @brief string command validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// boardlink headers
#include "components/StringCommand.hpp"
#include "core/Errors.hpp"

namespace boardlink::components {

  std::string StringCommand::execute(const std::string& command) {
    if (command.empty())
      throw core::InvalidArgument("A command must not be an empty string.");
    return backend_.executeStringCommand(command);
  }

} // namespace boardlink::components

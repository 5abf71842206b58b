#pragma once
/** @file  StringCommand.hpp
 *  @brief Raw ASCII command channel for boards running custom firmware.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "components/Component.hpp"

namespace boardlink::components {

  class StringCommandInterface {
  public:
    virtual ~StringCommandInterface() = default;

    /// Sends \p command and blocks for the reply.
    virtual std::string executeStringCommand(const std::string& command) = 0;
  };

  class StringCommand : public Component {
  public:
    StringCommand(int identifier, StringCommandInterface& backend)
        : Component(identifier), backend_(backend) {}

    /// Throws `core::InvalidArgument` for an empty command.
    std::string execute(const std::string& command);

    std::string operator()(const std::string& command) { return execute(command); }

  private:
    StringCommandInterface& backend_;
  };

} // namespace boardlink::components

#pragma once
/** @file  ServoBoard.hpp
 *  @brief Twelve-channel servo controller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "boards/Board.hpp"
#include "components/ComponentList.hpp"
#include "components/Servo.hpp"

namespace boardlink::boards {

  class ServoBoard : public Board {
  public:
    using RequiredInterfaces = components::InterfaceList<components::ServoInterface>;

    static constexpr const char* kName = "Student Robotics v4 Servo Board";
    static constexpr int kServoCount = 12;

    template <typename BackendT>
      requires components::ImplementsInterfaces<BackendT, RequiredInterfaces>
    explicit ServoBoard(std::unique_ptr<BackendT> backend)
        : Board(std::move(backend)), servos_(servoIdentifiers(), backendAs<BackendT>()) {}

    std::string name() const override { return kName; }

    components::ComponentList<components::Servo>& servos() { return servos_; }

  protected:
    /// Servos hold their last position.
    void makeComponentsSafe(core::SafetyReport&) override {}

  private:
    static std::vector<int> servoIdentifiers() {
      std::vector<int> ids;
      for (int i = 0; i < kServoCount; ++i)
        ids.push_back(i);
      return ids;
    }

    components::ComponentList<components::Servo> servos_;
  };

} // namespace boardlink::boards

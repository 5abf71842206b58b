// boardlink headers
#include "boards/BoardGroup.hpp"
#include "boards/MotorBoard.hpp"
#include "boards/PowerBoard.hpp"
#include "core/Errors.hpp"

// boardlink-fake headers
#include "MockBackends.hpp"

// STL headers
#include <algorithm>
#include <chrono>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace boardlink::test {

  using boardlink::boards::BoardGroup;
  using boardlink::boards::MotorBoard;
  using boardlink::boards::PowerBoard;
  using boardlink::boards::PowerOutputPosition;
  using boardlink::components::MotorSpecialState;
  using boardlink::components::MotorState;
  using ::testing::_;
  using ::testing::HasSubstr;
  using ::testing::InSequence;
  using ::testing::Return;
  using ::testing::Throw;

  namespace {

    std::unique_ptr<MotorBoard> motorBoard(const std::string& serial,
                                           testing::NiceMock<MockMotorBackend>** out = nullptr) {
      auto backend = std::make_unique<testing::NiceMock<MockMotorBackend>>(serial);
      if (out)
        *out = backend.get();
      return std::make_unique<MotorBoard>(std::move(backend));
    }

    std::vector<std::unique_ptr<MotorBoard>> motorBoards(std::vector<std::string> serials) {
      std::vector<std::unique_ptr<MotorBoard>> boards;
      for (const auto& serial : serials)
        boards.push_back(motorBoard(serial));
      return boards;
    }

  } // namespace

  //---board group------------------------------------------------------------

  TEST(board_group, singular_NeedsExactlyOneBoard) {
    BoardGroup<MotorBoard> none("MockMotorBackend", {});
    BoardGroup<MotorBoard> one("MockMotorBackend", motorBoards({ "SR1" }));
    BoardGroup<MotorBoard> two("MockMotorBackend", motorBoards({ "SR1", "SR2" }));

    EXPECT_EQ("SR1", one.singular().serialNumber());
    try {
      none.singular();
      FAIL() << "expected BoardCountError";
    } catch (const core::BoardCountError& e) {
      EXPECT_TRUE(e.noneFound());
    }
    try {
      two.singular();
      FAIL() << "expected BoardCountError";
    } catch (const core::BoardCountError& e) {
      EXPECT_TRUE(e.multipleFound());
      EXPECT_THAT(e.what(), HasSubstr(MotorBoard::kName));
    }
  }

  TEST(board_group, get_LooksUpBySerial) {
    BoardGroup<MotorBoard> group("MockMotorBackend", motorBoards({ "SR2", "SR1" }));

    EXPECT_EQ("SR1", group["SR1"].serialNumber());
    EXPECT_TRUE(group.contains("SR2"));
    EXPECT_FALSE(group.contains("SR3"));
    EXPECT_THROW(group.get("SR3"), core::BoardNotFound);
  }

  TEST(board_group, iteration_KeepsDiscoveryOrder) {
    BoardGroup<MotorBoard> group("MockMotorBackend", motorBoards({ "B", "A", "C" }));

    std::vector<std::string> serials;
    for (auto& board : group)
      serials.push_back(board.serialNumber());

    EXPECT_EQ((std::vector<std::string>{ "B", "A", "C" }), serials);
    EXPECT_EQ(3u, group.count());
  }

  TEST(board_group, constructor_RejectsDuplicateSerials) {
    EXPECT_THROW(BoardGroup<MotorBoard>("MockMotorBackend", motorBoards({ "SR1", "SR1" })),
                 core::DiscoveryAmbiguity);
  }

  TEST(board_group, discover_RejectsDuplicateSerials) {
    MockMotorBackend::Config config;
    config.serials = { "SR1", "SR2", "SR1" };

    try {
      BoardGroup<MotorBoard>::discover<MockMotorBackend>(config);
      FAIL() << "expected DiscoveryAmbiguity";
    } catch (const core::DiscoveryAmbiguity& e) {
      EXPECT_THAT(e.what(), HasSubstr("SR1"));
    }
  }

  TEST(board_group, iterator_WorksWithAlgorithms) {
    BoardGroup<MotorBoard> group("MockMotorBackend", motorBoards({ "B", "A", "C" }));

    EXPECT_EQ(3, std::distance(group.begin(), group.end()));
    EXPECT_EQ(1, std::count_if(group.begin(), group.end(), [](MotorBoard& board) {
                return board.serialNumber() == "A";
              }));
    auto it = std::find_if(group.begin(), group.end(),
                           [](MotorBoard& board) { return board.serialNumber() == "C"; });
    ASSERT_NE(group.end(), it);
    EXPECT_EQ(&group.get("C"), &*it);
  }

  TEST(board_group, discover_UsesBackendDiscovery) {
    MockMotorBackend::Config config;
    config.serials = { "X", "Y" };

    auto group = BoardGroup<MotorBoard>::discover<MockMotorBackend>(config);

    EXPECT_EQ("MockMotorBackend", group.backendName());
    EXPECT_EQ(2u, group.count());
  }

  //---board / make safe-----------------------------------------------------

  TEST(motor_board, toString_NamesBoardAndSerial) {
    auto board = motorBoard("SR0XY");

    EXPECT_EQ("Student Robotics v4 Motor Board - SR0XY", board->toString());
    EXPECT_EQ(2u, board->motors().size());
  }

  TEST(motor_board, makeSafe_ContinuesPastFailingMotor) {
    testing::NiceMock<MockMotorBackend>* backend = nullptr;
    auto board = motorBoard("SR1", &backend);

    EXPECT_CALL(*backend, setMotorState(0, MotorState{ MotorSpecialState::Brake }))
        .WillOnce(Throw(core::TransportTimeout("no reply")));
    EXPECT_CALL(*backend, setMotorState(1, MotorState{ MotorSpecialState::Brake }));

    auto report = board->makeSafe();

    ASSERT_EQ(1u, report.faults().size());
    const auto& fault = report.faults().front();
    EXPECT_EQ("Student Robotics v4 Motor Board - SR1", fault.board);
    EXPECT_EQ("Motor", fault.component);
    EXPECT_EQ(0, fault.identifier);
    EXPECT_EQ("no reply", fault.message);
  }

  TEST(motor_board, makeSafe_UsesConfiguredSafeState) {
    auto backend = std::make_unique<testing::StrictMock<MockMotorBackend>>("SR1");
    auto* raw = backend.get();
    MotorBoard board(std::move(backend), MotorSpecialState::Coast);

    EXPECT_CALL(*raw, setMotorState(_, MotorState{ MotorSpecialState::Coast })).Times(2);
    EXPECT_TRUE(board.makeSafe().ok());
  }

  TEST(board_group, makeSafe_VisitsEveryBoard) {
    MockMotorBackend::Config config;
    config.serials = { "A", "B" };
    config.onCreate = [](MockMotorBackend& backend) {
      EXPECT_CALL(backend, setMotorState(0, _)).WillOnce(Throw(core::TransportFailure("gone")));
      EXPECT_CALL(backend, setMotorState(1, _));
    };
    auto group = BoardGroup<MotorBoard>::discover<MockMotorBackend>(config);

    auto report = group.makeSafe();

    ASSERT_EQ(2u, report.faults().size());
    EXPECT_EQ("Student Robotics v4 Motor Board - A", report.faults()[0].board);
    EXPECT_EQ("Student Robotics v4 Motor Board - B", report.faults()[1].board);
  }

  //---power board------------------------------------------------------------

  TEST(power_board, controllableOutputs_FollowFeatures) {
    using Features = PowerBoard::Features;

    EXPECT_EQ((std::vector<int>{ 0, 1, 2, 3, 4, 5 }),
              PowerBoard::controllableOutputs(Features{}));
    EXPECT_EQ((std::vector<int>{ 0, 1, 2, 3, 5, 6 }),
              PowerBoard::controllableOutputs(Features{ true, true }));
  }

  TEST(power_board, output_RejectsUncontrollablePosition) {
    auto backend = std::make_unique<testing::NiceMock<MockPowerBackend>>();
    auto* raw = backend.get();
    PowerBoard board(std::move(backend), PowerBoard::Features{ true, false });

    EXPECT_CALL(*raw, setPowerOutputEnabled(5, true));
    board.output(PowerOutputPosition::L3).setEnabled(true);

    EXPECT_THROW(board.output(PowerOutputPosition::L2), core::InvalidArgument);
    EXPECT_THROW(board.output(PowerOutputPosition::FiveVolt), core::InvalidArgument);
  }

  TEST(power_board, makeSafe_SwitchesAllOutputsOff) {
    auto backend = std::make_unique<testing::StrictMock<MockPowerBackend>>();
    auto* raw = backend.get();
    PowerBoard board(std::move(backend));

    for (int i = 0; i < 6; ++i)
      EXPECT_CALL(*raw, setPowerOutputEnabled(i, false));

    EXPECT_TRUE(board.makeSafe().ok());
  }

  TEST(power_board, waitForStartFlash_BlinksUntilPressed) {
    auto backend = std::make_unique<testing::NiceMock<MockPowerBackend>>();
    auto* raw = backend.get();
    PowerBoard board(std::move(backend));

    EXPECT_CALL(*raw, getButtonState(0))
        .WillOnce(Return(false))
        .WillOnce(Return(false))
        .WillOnce(Return(true));
    {
      InSequence seq;
      EXPECT_CALL(*raw, setLedState(PowerBoard::kRunLed, true));
      EXPECT_CALL(*raw, setLedState(PowerBoard::kRunLed, true));
    }

    board.waitForStartFlash(std::chrono::milliseconds(1));
  }

  TEST(power_board, components_ReachBackend) {
    auto backend = std::make_unique<testing::NiceMock<MockPowerBackend>>();
    auto* raw = backend.get();
    PowerBoard board(std::move(backend));

    EXPECT_CALL(*raw, getBatterySensorVoltage(0)).WillOnce(Return(12.1));
    EXPECT_CALL(*raw, setLedState(PowerBoard::kErrorLed, true));
    EXPECT_CALL(*raw, setPowerOutputEnabled(_, true)).Times(6);

    EXPECT_DOUBLE_EQ(12.1, board.batterySensor().voltage());
    board.errorLed().setState(true);
    board.outputs().powerOn();
  }

} // namespace boardlink::test

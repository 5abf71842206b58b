// boardlink headers
#include "backends/Environment.hpp"
#include "backends/Environments.hpp"
#include "backends/console/ServoBoardConsoleBackend.hpp"
#include "backends/hardware/MotorBoardHardwareBackend.hpp"
#include "boards/MotorBoard.hpp"
#include "boards/PowerBoard.hpp"
#include "boards/Ruggeduino.hpp"
#include "boards/ServoBoard.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Robot.hpp"

// boardlink-fake headers
#include "FakeSerialChannel.hpp"
#include "FakeSerialPortEnumerator.hpp"
#include "FakeUsbDevice.hpp"
#include "MockBackends.hpp"

// STL headers
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace boardlink::test {

  using boardlink::backends::Environment;
  using boardlink::boards::MotorBoard;
  using boardlink::boards::PowerBoard;
  using boardlink::boards::Ruggeduino;
  using boardlink::boards::ServoBoard;
  using ::testing::_;
  using ::testing::HasSubstr;
  using ::testing::Throw;

  class MockErrorMonitor : public core::ErrorMonitor {
  public:
    MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
  };

  namespace {

    Environment mockEnvironment(MockMotorBackend::Config config = {}) {
      Environment env("MockEnvironment");
      env.registerBackend<MockMotorBackend>(std::move(config));
      return env;
    }

  } // namespace

  //---environment------------------------------------------------------------

  TEST(environment, registerBackend_OneBackendPerBoard) {
    Environment env("TestEnvironment");
    env.registerBackend<MockMotorBackend>();

    EXPECT_TRUE(env.supports<MotorBoard>());
    EXPECT_FALSE(env.supports<PowerBoard>());
    EXPECT_EQ("MockMotorBackend", env.backendName<MotorBoard>());
    EXPECT_THROW(env.registerBackend<MockMotorBackend>(), std::runtime_error);
  }

  TEST(environment, boardGroup_UnsupportedBoardNamesEnvironment) {
    Environment env = mockEnvironment();

    try {
      env.boardGroup<ServoBoard>();
      FAIL() << "expected NotSupportedByEnvironment";
    } catch (const core::NotSupportedByEnvironment& e) {
      EXPECT_STREQ("The MockEnvironment does not support Student Robotics v4 Servo Board",
                   e.what());
    }
    EXPECT_THROW(env.backendName<ServoBoard>(), core::NotSupportedByEnvironment);
  }

  TEST(environment, boardGroup_DiscoversWithRegisteredConfig) {
    MockMotorBackend::Config config;
    config.serials = { "M1", "M2" };
    Environment env = mockEnvironment(config);

    auto first = env.boardGroup<MotorBoard>();
    auto second = env.boardGroup<MotorBoard>();

    EXPECT_EQ(2u, first.count());
    EXPECT_TRUE(second.contains("M2"));
  }

  TEST(environment, merge_AddsDisjointRegistrations) {
    Environment env = mockEnvironment();
    Environment console("ConsoleEnvironment");
    console.registerBackend<backends::ServoBoardConsoleBackend>();

    env.merge(console);

    EXPECT_EQ((std::vector<std::string>{ "Student Robotics v4 Motor Board",
                                         "Student Robotics v4 Servo Board" }),
              env.supportedBoards());
    EXPECT_EQ("ServoBoardConsoleBackend", env.backendName<ServoBoard>());
  }

  TEST(environment, merge_ConflictChangesNothing) {
    Environment env("Mine");
    env.registerBackend<backends::ServoBoardConsoleBackend>();
    Environment other = mockEnvironment();
    other.registerBackend<backends::ServoBoardConsoleBackend>();

    try {
      env.merge(other);
      FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
      EXPECT_THAT(e.what(), HasSubstr("Student Robotics v4 Servo Board"));
    }
    EXPECT_FALSE(env.supports<MotorBoard>());
  }

  TEST(environment, moveConstructor_KeepsNameAndRegistrations) {
    Environment source = mockEnvironment();
    Environment moved(std::move(source));

    EXPECT_EQ("MockEnvironment", moved.name());
    EXPECT_TRUE(moved.supports<MotorBoard>());
    EXPECT_EQ(1u, moved.boardGroup<MotorBoard>().count());
  }

  //---stock environments------------------------------------------------------

  TEST(environments, consoleEnvironment_SupportsEveryBoard) {
    core::RuntimeConfig config;
    config.consoleSerials = { "C1" };
    std::ostringstream out;
    std::istringstream in;

    Environment env = backends::makeConsoleEnvironment(config, out, in);

    EXPECT_EQ("ConsoleEnvironment", env.name());
    EXPECT_EQ((std::vector<std::string>{ "Ruggeduino", "Student Robotics v4 Motor Board",
                                         "Student Robotics v4 Power Board",
                                         "Student Robotics v4 Servo Board" }),
              env.supportedBoards());
    EXPECT_EQ("C1", env.boardGroup<MotorBoard>().singular().serialNumber());
  }

  TEST(environments, hardwareEnvironment_DiscoversThroughTransports) {
    std::ostringstream logs;
    auto logger = std::make_shared<core::Logger>(logs);

    FakeSerialBus bus;
    auto line = bus.add(serialPort("/dev/ttyUSB0", 0x0403, 0x6001, "SR0MOT", "Student Robotics",
                                   "MCV4B"));
    line->responder = [](const std::string& cmd) -> std::optional<std::string> {
      if (cmd.size() == 1 && cmd[0] == backends::MotorBoardHardwareBackend::kCmdVersion)
        return std::string("MCV4B:3");
      return std::nullopt;
    };
    auto power = bus.add(serialPort("/dev/ttyACM0", 0x1bda, 0x0010, "SRPOWER4",
                                    "Student Robotics", "PBV4B"));
    power->responder = [](const std::string& cmd) -> std::optional<std::string> {
      if (cmd == "*IDN?\n")
        return std::string("Student Robotics:PBv4B:SRPOWER4:4.4");
      return std::string("ACK");
    };
    auto usb = std::make_shared<FakeUsbContext>();
    usb->add(usbInfo(0x1bda, 0x0010, "SRPOWER", 2))->reads[9] = { 3, 0, 0, 0 };

    auto serial = bus.config(logger);
    backends::HardwareTransports transports;
    transports.serialPorts = serial.enumerator;
    transports.channelFactory = serial.channelFactory;
    transports.usb = usb;

    Environment env = backends::makeHardwareEnvironment(core::RuntimeConfig{}, logger, transports);

    EXPECT_EQ("HardwareEnvironment", env.name());
    EXPECT_EQ("SR0MOT", env.boardGroup<MotorBoard>().singular().serialNumber());
    auto powerBoards = env.boardGroup<PowerBoard>();
    EXPECT_EQ(2u, powerBoards.count());
    EXPECT_TRUE(powerBoards.contains("SRPOWER"));
    EXPECT_TRUE(powerBoards.contains("SRPOWER4"));
    EXPECT_TRUE(env.boardGroup<Ruggeduino>().empty());
    EXPECT_TRUE(env.boardGroup<ServoBoard>().empty());
  }

  TEST(environments, makeEnvironment_PicksByName) {
    core::RuntimeConfig config;
    config.environment = "console";
    EXPECT_EQ("ConsoleEnvironment", backends::makeEnvironment(config).name());

    config.environment = "simulator";
    EXPECT_THROW(backends::makeEnvironment(config), std::runtime_error);
  }

  //---robot------------------------------------------------------------------

  TEST(robot, constructor_NeedsErrorMonitor) {
    EXPECT_THROW(core::Robot(mockEnvironment(), nullptr), std::invalid_argument);
  }

  TEST(robot, discover_CachesGroups) {
    auto monitor = std::make_shared<testing::StrictMock<MockErrorMonitor>>();
    core::Robot robot(mockEnvironment(), monitor);

    auto& first = robot.discover<MotorBoard>();
    auto& second = robot.discover<MotorBoard>();

    EXPECT_EQ(&first, &second);
    EXPECT_THROW(robot.discover<PowerBoard>(), core::NotSupportedByEnvironment);
    EXPECT_TRUE(robot.makeSafe().ok());
  }

  TEST(robot, makeSafe_ReportsFaultsAndRunsAgainOnShutdown) {
    auto monitor = std::make_shared<testing::StrictMock<MockErrorMonitor>>();
    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("Motor 1: stalled"))).Times(2);

    MockMotorBackend::Config config;
    config.onCreate = [](MockMotorBackend& backend) {
      EXPECT_CALL(backend, setMotorState(1, _))
          .WillRepeatedly(Throw(core::TransportFailure("stalled")));
    };
    {
      core::Robot robot(mockEnvironment(config), monitor);
      robot.discover<MotorBoard>();

      auto report = robot.makeSafe();

      ASSERT_EQ(1u, report.faults().size());
      EXPECT_EQ("Student Robotics v4 Motor Board - MOCK", report.faults()[0].board);
    }
  }

  TEST(robot, destructor_SafesConsoleBoards) {
    core::RuntimeConfig config;
    std::ostringstream out;
    std::istringstream in;
    {
      core::Robot robot(backends::makeConsoleEnvironment(config, out, in),
                        std::make_shared<testing::StrictMock<MockErrorMonitor>>());
      robot.discover<MotorBoard>().singular().motors()[0].setPower(0.25);
    }
    EXPECT_THAT(out.str(), HasSubstr("Setting motor 0 to BRAKE."));
  }

} // namespace boardlink::test

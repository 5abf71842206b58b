// boardlink headers
#include "components/ComponentList.hpp"
#include "components/GpioPin.hpp"
#include "components/Motor.hpp"
#include "components/Piezo.hpp"
#include "components/PowerOutput.hpp"
#include "components/Servo.hpp"
#include "components/StringCommand.hpp"
#include "core/Errors.hpp"

// STL headers
#include <chrono>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace boardlink::test {

  using namespace boardlink::components;
  using boardlink::core::BadGpioPinMode;
  using boardlink::core::InvalidArgument;
  using boardlink::core::NotSupportedByHardware;
  using ::testing::_;
  using ::testing::DoubleEq;
  using ::testing::Return;

  class MockMotorInterface : public MotorInterface {
  public:
    MOCK_METHOD(MotorState, getMotorState, (int), (override));
    MOCK_METHOD(void, setMotorState, (int, const MotorState&), (override));
  };

  class MockServoInterface : public ServoInterface {
  public:
    MOCK_METHOD(ServoPosition, getServoPosition, (int), (override));
    MOCK_METHOD(void, setServoPosition, (int, ServoPosition), (override));
  };

  class MockPiezoInterface : public PiezoInterface {
  public:
    MOCK_METHOD(void, buzz, (int, std::chrono::milliseconds, double, bool), (override));
  };

  class MockGpioPinInterface : public GpioPinInterface {
  public:
    MOCK_METHOD(void, setGpioPinMode, (int, GpioPinMode), (override));
    MOCK_METHOD(GpioPinMode, getGpioPinMode, (int), (override));
    MOCK_METHOD(void, writeGpioPinDigitalState, (int, bool), (override));
    MOCK_METHOD(bool, getGpioPinDigitalState, (int), (override));
    MOCK_METHOD(bool, readGpioPinDigitalState, (int), (override));
    MOCK_METHOD(double, readGpioPinAnalogueValue, (int), (override));
  };

  class MockStringCommandInterface : public StringCommandInterface {
  public:
    MOCK_METHOD(std::string, executeStringCommand, (const std::string&), (override));
  };

  class MockPowerOutputInterface : public PowerOutputInterface {
  public:
    MOCK_METHOD(bool, getPowerOutputEnabled, (int), (override));
    MOCK_METHOD(void, setPowerOutputEnabled, (int, bool), (override));
    MOCK_METHOD(double, getPowerOutputCurrent, (int), (override));
  };

  //---motor----------------------------------------------------------------

  TEST(motor, setPower_ForwardsPowersAndSpecialStates) {
    testing::StrictMock<MockMotorInterface> backend;
    Motor motor(1, backend);

    EXPECT_CALL(backend, setMotorState(1, MotorState{ 0.5 }));
    EXPECT_CALL(backend, setMotorState(1, MotorState{ -1.0 }));
    EXPECT_CALL(backend, setMotorState(1, MotorState{ MotorSpecialState::Coast }));

    motor.setPower(0.5);
    motor.setPower(-1.0);
    motor.setPower(MotorSpecialState::Coast);
  }

  TEST(motor, setPower_OutOfRangeNeverReachesBackend) {
    testing::StrictMock<MockMotorInterface> backend;
    Motor motor(0, backend);

    EXPECT_CALL(backend, setMotorState(_, _)).Times(0);

    EXPECT_THROW(motor.setPower(1.01), InvalidArgument);
    EXPECT_THROW(motor.setPower(-2.0), InvalidArgument);
    EXPECT_THROW(motor.setPower(std::numeric_limits<double>::quiet_NaN()), InvalidArgument);
  }

  TEST(motor, power_ReadsBackend) {
    MockMotorInterface backend;
    Motor motor(0, backend);
    EXPECT_CALL(backend, getMotorState(0)).WillOnce(Return(MotorState{ MotorSpecialState::Brake }));

    EXPECT_EQ(MotorState{ MotorSpecialState::Brake }, motor.power());
  }

  TEST(motor, toString_NamesSpecialStates) {
    EXPECT_EQ("BRAKE", toString(MotorState{ MotorSpecialState::Brake }));
    EXPECT_EQ("COAST", toString(MotorState{ MotorSpecialState::Coast }));
    EXPECT_EQ("0.25", toString(MotorState{ 0.25 }));
  }

  //---servo----------------------------------------------------------------

  TEST(servo, setPosition_ValidatesRange) {
    testing::StrictMock<MockServoInterface> backend;
    Servo servo(3, backend);

    EXPECT_CALL(backend, setServoPosition(3, ServoPosition{ 1.0 }));
    EXPECT_CALL(backend, setServoPosition(3, ServoPosition{}));

    servo.setPosition(1.0);
    servo.setPosition(std::nullopt);
    EXPECT_THROW(servo.setPosition(1.5), InvalidArgument);
    EXPECT_THROW(servo.setPosition(std::numeric_limits<double>::quiet_NaN()), InvalidArgument);
  }

  //---piezo----------------------------------------------------------------

  TEST(piezo, buzz_ResolvesNotes) {
    testing::StrictMock<MockPiezoInterface> backend;
    Piezo piezo(0, backend);

    EXPECT_CALL(backend, buzz(0, std::chrono::milliseconds(250), DoubleEq(1046.50), false));
    EXPECT_CALL(backend, buzz(0, std::chrono::milliseconds(100), DoubleEq(440.0), true));

    piezo.buzz(std::chrono::milliseconds(250), Note::C6);
    piezo.buzz(std::chrono::milliseconds(100), 440.0, true);
  }

  TEST(piezo, buzz_RejectsBadInputBeforeIo) {
    testing::StrictMock<MockPiezoInterface> backend;
    Piezo piezo(0, backend);

    EXPECT_CALL(backend, buzz(_, _, _, _)).Times(0);

    EXPECT_THROW(piezo.buzz(std::chrono::milliseconds(-1), 440.0), InvalidArgument);
    EXPECT_THROW(piezo.buzz(std::chrono::milliseconds(10), 0.0), InvalidArgument);
    EXPECT_THROW(piezo.buzz(std::chrono::milliseconds(10), -5.0), InvalidArgument);
  }

  TEST(piezo, frequency_CoversTwoOctaves) {
    EXPECT_DOUBLE_EQ(1760.00, frequency(Note::A6));
    EXPECT_DOUBLE_EQ(3951.07, frequency(Note::B7));
  }

  //---gpio pin-------------------------------------------------------------

  class GpioPinTest : public ::testing::Test {
  protected:
    testing::NiceMock<MockGpioPinInterface> backend;
    const std::vector<GpioPinMode> modes{ GpioPinMode::DigitalInput,
                                          GpioPinMode::DigitalOutput };
  };

  TEST_F(GpioPinTest, constructor_AppliesFirstSupportedMode) {
    EXPECT_CALL(backend, setGpioPinMode(4, GpioPinMode::DigitalInput));
    GpioPin pin(4, backend, modes);
  }

  TEST_F(GpioPinTest, setMode_RejectsUnsupportedMode) {
    GpioPin pin(4, backend, modes);

    EXPECT_CALL(backend, setGpioPinMode(_, _)).Times(0);
    EXPECT_THROW(pin.setMode(GpioPinMode::PwmOutput), NotSupportedByHardware);
  }

  TEST_F(GpioPinTest, digitalState_ReadsOrReportsByMode) {
    GpioPin pin(4, backend, modes);

    EXPECT_CALL(backend, getGpioPinMode(4))
        .WillOnce(Return(GpioPinMode::DigitalInput))
        .WillOnce(Return(GpioPinMode::DigitalOutput));
    EXPECT_CALL(backend, readGpioPinDigitalState(4)).WillOnce(Return(true));
    EXPECT_CALL(backend, getGpioPinDigitalState(4)).WillOnce(Return(false));

    EXPECT_TRUE(pin.digitalState());
    EXPECT_FALSE(pin.digitalState());
  }

  TEST_F(GpioPinTest, setDigitalState_NeedsOutputMode) {
    GpioPin pin(4, backend, modes);
    ON_CALL(backend, getGpioPinMode(4)).WillByDefault(Return(GpioPinMode::DigitalInput));

    EXPECT_CALL(backend, writeGpioPinDigitalState(_, _)).Times(0);
    EXPECT_THROW(pin.setDigitalState(true), BadGpioPinMode);
    EXPECT_THROW(pin.analogueValue(), BadGpioPinMode);
  }

  TEST_F(GpioPinTest, constructor_RejectsEmptyModeList) {
    EXPECT_THROW(GpioPin(4, backend, {}), InvalidArgument);
  }

  //---string command--------------------------------------------------------

  TEST(string_command, execute_RejectsEmptyCommand) {
    testing::StrictMock<MockStringCommandInterface> backend;
    StringCommand command(0, backend);

    EXPECT_CALL(backend, executeStringCommand("ping")).WillOnce(Return("pong"));

    EXPECT_EQ("pong", command("ping"));
    EXPECT_THROW(command.execute(""), InvalidArgument);
  }

  //---component list / power output group ----------------------------------

  TEST(component_list, access_ByPositionAndIdentifier) {
    testing::NiceMock<MockPowerOutputInterface> backend;
    ComponentList<PowerOutput> outputs({ 0, 1, 3 }, backend);

    EXPECT_EQ(3u, outputs.size());
    EXPECT_EQ(3, outputs[2].identifier());
    EXPECT_EQ(3, outputs.byIdentifier(3).identifier());
    EXPECT_THROW(outputs[3], InvalidArgument);
    EXPECT_THROW(outputs.byIdentifier(2), InvalidArgument);
  }

  TEST(component_list, powerOutputGroup_SwitchesEveryOutput) {
    testing::StrictMock<MockPowerOutputInterface> backend;
    ComponentList<PowerOutput> outputs({ 0, 1 }, backend);
    std::vector<std::reference_wrapper<PowerOutput>> refs(outputs.begin(), outputs.end());
    PowerOutputGroup group(refs);

    EXPECT_CALL(backend, setPowerOutputEnabled(0, true));
    EXPECT_CALL(backend, setPowerOutputEnabled(1, true));
    group.powerOn();
  }

} // namespace boardlink::test

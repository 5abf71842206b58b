// boardlink headers
#include "backends/console/Console.hpp"
#include "backends/console/MotorBoardConsoleBackend.hpp"
#include "backends/console/PowerBoardConsoleBackend.hpp"
#include "backends/console/RuggeduinoConsoleBackend.hpp"
#include "backends/console/ServoBoardConsoleBackend.hpp"
#include "boards/BoardGroup.hpp"
#include "core/Errors.hpp"

// STL headers
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace boardlink::test {

  using namespace boardlink::backends;
  using boardlink::boards::BoardGroup;
  using boardlink::components::GpioPinMode;
  using boardlink::components::MotorSpecialState;
  using boardlink::components::MotorState;
  using ::testing::HasSubstr;
  using ::testing::Not;

  /// Console backends wired to string streams instead of the terminal.
  class ConsoleTest : public ::testing::Test {
  protected:
    ConsoleConfig config(const std::string& input = "") {
      in.str(input);
      in.clear();
      ConsoleConfig cfg;
      cfg.out = &out;
      cfg.in = &in;
      return cfg;
    }

    std::ostringstream out;
    std::istringstream in;
  };

  //---console----------------------------------------------------------------

  TEST_F(ConsoleTest, constructor_RejectsMissingStreams) {
    ConsoleConfig noOut = config();
    noOut.out = nullptr;
    EXPECT_THROW(BoardGroup<boards::MotorBoard>::discover<MotorBoardConsoleBackend>(noOut),
                 std::invalid_argument);

    ConsoleConfig noIn = config();
    noIn.in = nullptr;
    EXPECT_THROW(BoardGroup<boards::MotorBoard>::discover<MotorBoardConsoleBackend>(noIn),
                 std::invalid_argument);
  }

  TEST_F(ConsoleTest, read_RepromptsUntilReplyParses) {
    in.str("abc\n12.5\n");
    Console console("PowerBoard(SERIAL)", out, in);

    EXPECT_DOUBLE_EQ(12.5, console.read<double>("Battery voltage [volts]"));
    EXPECT_THAT(out.str(), HasSubstr("PowerBoard(SERIAL): Unable to construct a float from 'abc'"));
    EXPECT_THAT(out.str(), HasSubstr("PowerBoard(SERIAL): Battery voltage [volts]: "));
  }

  TEST_F(ConsoleTest, read_AcceptsBooleanWords) {
    in.str(" Yes \nmaybe\nFALSE\n");
    Console console("Ruggeduino(SERIAL)", out, in);

    EXPECT_TRUE(console.read<bool>("Pin 2 digital state [true/false]"));
    EXPECT_FALSE(console.read<bool>("Pin 2 digital state [true/false]"));
    EXPECT_THAT(out.str(), HasSubstr("Unable to construct a bool from 'maybe'"));
  }

  TEST_F(ConsoleTest, read_ClosedInputIsTransportFailure) {
    Console console("MotorBoard(SERIAL)", out, in);
    EXPECT_THROW(console.read<double>("anything"), core::TransportFailure);
  }

  //---motor board------------------------------------------------------------

  TEST_F(ConsoleTest, motorBoard_PrintsAndRemembersState) {
    auto group = BoardGroup<boards::MotorBoard>::discover<MotorBoardConsoleBackend>(config());
    auto& board = group.singular();

    EXPECT_EQ("SERIAL", board.serialNumber());
    EXPECT_FALSE(board.firmwareVersion());
    EXPECT_EQ(MotorState{ MotorSpecialState::Brake }, board.motors()[0].power());

    board.motors()[0].setPower(0.5);

    EXPECT_EQ(MotorState{ 0.5 }, board.motors()[0].power());
    EXPECT_THAT(out.str(), HasSubstr("MotorBoard(SERIAL): Setting motor 0 to 0.5.\n"));
  }

  TEST_F(ConsoleTest, motorBoard_MakeSafeBrakesBothMotors) {
    auto group = BoardGroup<boards::MotorBoard>::discover<MotorBoardConsoleBackend>(config());
    auto& board = group.singular();
    board.motors()[0].setPower(0.5);
    board.motors()[1].setPower(-1.0);
    EXPECT_EQ(MotorState{ -1.0 }, board.motors()[1].power());

    EXPECT_TRUE(group.makeSafe().ok());

    EXPECT_EQ(MotorState{ MotorSpecialState::Brake }, board.motors()[0].power());
    EXPECT_EQ(MotorState{ MotorSpecialState::Brake }, board.motors()[1].power());
    EXPECT_THAT(out.str(), HasSubstr("Setting motor 0 to BRAKE."));
    EXPECT_THAT(out.str(), HasSubstr("Setting motor 1 to BRAKE."));
  }

  TEST_F(ConsoleTest, motorBoard_OneBoardPerSerial) {
    auto cfg = config();
    cfg.serialNumbers = { "SR1", "SR2" };

    auto group = BoardGroup<boards::MotorBoard>::discover<MotorBoardConsoleBackend>(cfg);

    EXPECT_EQ(2u, group.count());
    EXPECT_TRUE(group.contains("SR2"));
    EXPECT_THROW(group.singular(), core::BoardCountError);
  }

  //---servo board------------------------------------------------------------

  TEST_F(ConsoleTest, servoBoard_StartsUnpowered) {
    auto group = BoardGroup<boards::ServoBoard>::discover<ServoBoardConsoleBackend>(config());
    auto& servo = group.singular().servos()[11];

    EXPECT_FALSE(servo.position());
    servo.setPosition(-0.25);
    EXPECT_EQ(-0.25, servo.position().value_or(0.0));
    servo.setPosition(std::nullopt);

    EXPECT_THAT(out.str(), HasSubstr("ServoBoard(SERIAL): Setting servo 11 to -0.25."));
    EXPECT_THAT(out.str(), HasSubstr("Setting servo 11 to unpowered."));
  }

  //---power board------------------------------------------------------------

  TEST_F(ConsoleTest, powerBoard_AsksForMeasurements) {
    auto group = BoardGroup<boards::PowerBoard>::discover<PowerBoardConsoleBackend>(
        config("11.9\n2.5\ntrue\n0.75\n"));
    auto& board = group.singular();

    EXPECT_DOUBLE_EQ(11.9, board.batterySensor().voltage());
    EXPECT_DOUBLE_EQ(2.5, board.batterySensor().current());
    EXPECT_TRUE(board.startButton().isPressed());
    EXPECT_DOUBLE_EQ(0.75, board.output(boards::PowerOutputPosition::H1).current());

    EXPECT_THAT(out.str(), HasSubstr("PowerBoard(SERIAL): Battery voltage [volts]: "));
    EXPECT_THAT(out.str(), HasSubstr("Current for power output 1 [amps]: "));
  }

  TEST_F(ConsoleTest, powerBoard_ExposesFiveVoltOutput) {
    auto group = BoardGroup<boards::PowerBoard>::discover<PowerBoardConsoleBackend>(config());
    auto& board = group.singular();

    EXPECT_EQ(7u, board.outputs().size());
    board.output(boards::PowerOutputPosition::FiveVolt).setEnabled(true);
    EXPECT_TRUE(board.output(boards::PowerOutputPosition::FiveVolt).isEnabled());
    EXPECT_THAT(out.str(), HasSubstr("Setting output 6 to true"));

    EXPECT_TRUE(group.makeSafe().ok());
    EXPECT_FALSE(board.output(boards::PowerOutputPosition::FiveVolt).isEnabled());
  }

  TEST_F(ConsoleTest, powerBoard_BuzzAndLeds) {
    auto group = BoardGroup<boards::PowerBoard>::discover<PowerBoardConsoleBackend>(config("\n"));
    auto& board = group.singular();

    board.piezo().buzz(std::chrono::milliseconds(500), 440.0);
    board.runLed().setState(true);
    board.startButton().waitUntilPressed();

    EXPECT_THAT(out.str(), HasSubstr("Buzzing at 440Hz for 500ms"));
    EXPECT_THAT(out.str(), HasSubstr("Set LED 0 to true"));
    EXPECT_THAT(out.str(), HasSubstr("Waiting for start button press."));
    EXPECT_TRUE(board.runLed().state());
    EXPECT_THROW(board.piezo().buzz(std::chrono::milliseconds(70000), 440.0), core::InvalidArgument);
  }

  //---ruggeduino-------------------------------------------------------------

  TEST_F(ConsoleTest, ruggeduino_PinModesAndStates) {
    auto group = BoardGroup<boards::Ruggeduino>::discover<RuggeduinoConsoleBackend>(
        config("true\n3.3\n"));
    auto& board = group.singular();

    auto& pin = board.pin(2);
    EXPECT_EQ(GpioPinMode::DigitalInput, pin.mode());
    EXPECT_TRUE(pin.digitalState());

    pin.setMode(GpioPinMode::DigitalOutput);
    pin.setDigitalState(true);
    EXPECT_TRUE(pin.digitalState());

    EXPECT_DOUBLE_EQ(3.3, board.pin(boards::AnaloguePin::A2).analogueValue());
    EXPECT_THROW(board.pin(20), core::InvalidArgument);

    EXPECT_THAT(out.str(), HasSubstr("Ruggeduino(SERIAL): Set pin 2 to DIGITAL_OUTPUT"));
    EXPECT_THAT(out.str(), HasSubstr("Pin 16 ADC state [float]: "));
  }

  TEST_F(ConsoleTest, ruggeduino_LedNeedsOutputMode) {
    auto group = BoardGroup<boards::Ruggeduino>::discover<RuggeduinoConsoleBackend>(config());
    auto& board = group.singular();

    EXPECT_THROW(board.led().setState(true), core::BadGpioPinMode);

    board.pin(13).setMode(GpioPinMode::DigitalOutput);
    board.led().setState(true);
    EXPECT_TRUE(board.led().state());
  }

  TEST_F(ConsoleTest, ruggeduino_StringCommandEchoesReply) {
    auto group = BoardGroup<boards::Ruggeduino>::discover<RuggeduinoConsoleBackend>(
        config("pong\n"));

    EXPECT_EQ("pong", group.singular().command()("ping"));
    EXPECT_THAT(out.str(), HasSubstr("Response to string command \"ping\" [str]: "));
  }

  TEST_F(ConsoleTest, ruggeduino_MakeSafeReturnsPinsToInput) {
    auto group = BoardGroup<boards::Ruggeduino>::discover<RuggeduinoConsoleBackend>(config());
    auto& board = group.singular();
    board.pin(7).setMode(GpioPinMode::DigitalOutput);

    EXPECT_TRUE(group.makeSafe().ok());
    EXPECT_EQ(GpioPinMode::DigitalInput, board.pin(7).mode());
    EXPECT_THAT(out.str(), Not(HasSubstr("Set pin 14 to DIGITAL_INPUT\n")));
  }

} // namespace boardlink::test

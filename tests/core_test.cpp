// boardlink headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/SafetyReport.hpp"

// STL headers
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

// third-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace boardlink::test {

  using namespace boardlink::core;
  using ::testing::HasSubstr;

  //---errors---------------------------------------------------------------

  TEST(errors, boardCountError_TellsNoneFromSeveral) {
    BoardCountError none("Ruggeduino", 0);
    BoardCountError several("Ruggeduino", 2);

    EXPECT_TRUE(none.noneFound());
    EXPECT_FALSE(none.multipleFound());
    EXPECT_TRUE(several.multipleFound());
    EXPECT_THAT(several.what(), HasSubstr("expected exactly one Ruggeduino"));
  }

  TEST(errors, transportErrors_AreCommunicationErrors) {
    EXPECT_THROW(throw DeviceBusy("claimed", 11), CommunicationError);
    EXPECT_THROW(throw TransportTimeout("silent"), CommunicationError);
    EXPECT_THROW(throw UnsupportedFirmware("v2"), CommunicationError);

    TransportFailure failure("stall", 32);
    EXPECT_EQ(32, failure.errorNumber());
  }

  TEST(errors, invalidArgument_IsStdInvalidArgument) {
    EXPECT_THROW(throw InvalidArgument("bad"), std::invalid_argument);
    EXPECT_THROW(throw BoardNotFound("X"), std::out_of_range);
  }

  //---logger---------------------------------------------------------------

  TEST(logger, log_WritesCsvLine) {
    std::ostringstream out;
    Logger logger(out, LogLevel::Debug);

    logger.info("MotorBoardHardwareBackend", "opened /dev/ttyUSB0");

    const std::string line = out.str();
    EXPECT_THAT(line, HasSubstr(",INFO,MotorBoardHardwareBackend,opened /dev/ttyUSB0\n"));
    EXPECT_EQ('Z', line.at(line.find(',') - 1));
  }

  TEST(logger, log_QuotesFieldsWithCommas) {
    LogEvent event{ std::chrono::system_clock::time_point{}, LogLevel::Warning, "Robot",
                    "said \"hi\", twice" };

    EXPECT_EQ("1970-01-01T00:00:00.000Z,WARNING,Robot,\"said \"\"hi\"\", twice\"\n",
              event.toCsv());
  }

  TEST(logger, log_DropsEventsBelowThreshold) {
    std::ostringstream out;
    Logger logger(out, LogLevel::Warning);

    logger.debug("Robot", "quiet");
    logger.info("Robot", "quiet");
    EXPECT_TRUE(out.str().empty());

    logger.setThreshold(LogLevel::Debug);
    logger.debug("Robot", "loud");
    EXPECT_THAT(out.str(), HasSubstr("DEBUG,Robot,loud"));
  }

  TEST(logger, parseLogLevel_IsCaseInsensitive) {
    EXPECT_EQ(LogLevel::Warning, parseLogLevel("WARNING").value_or(LogLevel::Off));
    EXPECT_EQ(LogLevel::Debug, parseLogLevel("debug").value_or(LogLevel::Off));
    EXPECT_FALSE(parseLogLevel("verbose"));
  }

  TEST(logger, attachFile_MirrorsEvents) {
    const auto path = std::filesystem::temp_directory_path() / "boardlink-logger-test.csv";
    std::filesystem::remove(path);
    {
      std::ostringstream out;
      Logger logger(out);
      ASSERT_TRUE(logger.attachFile(path.string()));
      logger.error("ErrorMonitor", "Motor 0: stalled");
    } // flush on destruction

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_THAT(line, HasSubstr("ERROR,ErrorMonitor,Motor 0: stalled"));
    std::filesystem::remove(path);
  }

  //---config---------------------------------------------------------------

  TEST(config, fromJson_ReadsEverySection) {
    auto doc = nlohmann::json::parse(R"({
      "environment": "console",
      "logging": { "level": "debug", "file": "/tmp/robot.csv" },
      "serial": { "timeout_ms": 500 },
      "usb": { "timeout_ms": 2000 },
      "console": { "serials": ["A", "B"] }
    })");

    auto cfg = RuntimeConfig::fromJson(doc);

    EXPECT_EQ("console", cfg.environment);
    EXPECT_EQ(LogLevel::Debug, cfg.logLevel);
    EXPECT_EQ("/tmp/robot.csv", cfg.logFile);
    EXPECT_EQ(std::chrono::milliseconds(500), cfg.serialTimeout);
    EXPECT_EQ(std::chrono::milliseconds(2000), cfg.usbTimeout);
    EXPECT_EQ((std::vector<std::string>{ "A", "B" }), cfg.consoleSerials);
  }

  TEST(config, fromJson_MissingKeysKeepDefaults) {
    auto cfg = RuntimeConfig::fromJson(nlohmann::json::object());

    EXPECT_EQ("hardware", cfg.environment);
    EXPECT_EQ(LogLevel::Info, cfg.logLevel);
    EXPECT_EQ(std::chrono::milliseconds(250), cfg.serialTimeout);
    EXPECT_EQ(std::vector<std::string>{ "SERIAL" }, cfg.consoleSerials);
  }

  TEST(config, fromJson_RejectsBadValues) {
    EXPECT_THROW(RuntimeConfig::fromJson(nlohmann::json::parse(R"({"environment": "mars"})")),
                 std::runtime_error);
    EXPECT_THROW(RuntimeConfig::fromJson(nlohmann::json::parse(R"({"serial": {"timeout_ms": 0}})")),
                 std::runtime_error);
    EXPECT_THROW(RuntimeConfig::fromJson(nlohmann::json::parse(R"({"logging": {"level": 3}})")),
                 std::runtime_error);
    EXPECT_THROW(RuntimeConfig::fromJson(nlohmann::json::parse("[]")), std::runtime_error);
  }

  TEST(config, load_ParsesFileAndReportsErrors) {
    const auto dir = std::filesystem::temp_directory_path();
    const auto good = dir / "boardlink-config-good.json";
    const auto bad = dir / "boardlink-config-bad.json";
    std::ofstream(good) << R"({"environment": "console"})";
    std::ofstream(bad) << "{ not json";

    EXPECT_EQ("console", ConfigLoader(good.string()).load().at("environment").get<std::string>());
    EXPECT_THROW(ConfigLoader(bad.string()).load(), std::runtime_error);
    EXPECT_THROW(ConfigLoader((dir / "boardlink-config-missing.json").string()).load(),
                 std::runtime_error);

    std::filesystem::remove(good);
    std::filesystem::remove(bad);
  }

  TEST(config, applyTo_SetsThreshold) {
    std::ostringstream out;
    Logger logger(out);
    RuntimeConfig cfg;
    cfg.logLevel = LogLevel::Error;

    cfg.applyTo(logger);

    EXPECT_EQ(LogLevel::Error, logger.threshold());
  }

  //---error monitor----------------------------------------------------------

  TEST(error_monitor, notifyFailure_EscalatesOncePerMessage) {
    std::ostringstream out;
    ErrorMonitor monitor(std::make_shared<Logger>(out));
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

    monitor.notifyFailure("Motor 0: stalled");
    monitor.notifyFailure("Motor 0: stalled");
    monitor.notifyFailure("Motor 1: stalled");

    EXPECT_EQ((std::vector<std::string>{ "Motor 0: stalled", "Motor 1: stalled" }), escalated);
    EXPECT_EQ(2u, monitor.failures().size());
    EXPECT_THAT(out.str(), HasSubstr("ERROR,ErrorMonitor,Motor 0: stalled"));
  }

  //---safety report----------------------------------------------------------

  TEST(safety_report, merge_KeepsOrderAndFormats) {
    SafetyReport first;
    first.add(ComponentFault{ "Student Robotics v4 Motor Board - SR1", "Motor", 0, "timeout" });
    SafetyReport second;
    second.add(ComponentFault{ "Ruggeduino - 123", "GpioPin", 13, "disconnected" });

    first.merge(second);

    ASSERT_EQ(2u, first.faults().size());
    EXPECT_FALSE(first.ok());
    EXPECT_EQ("Student Robotics v4 Motor Board - SR1: Motor 0: timeout\n"
              "Ruggeduino - 123: GpioPin 13: disconnected\n",
              first.toString());
    EXPECT_TRUE(SafetyReport().ok());
  }

} // namespace boardlink::test

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace dsb::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path log_dir;
  std::filesystem::path log_file;

  void SetUp() override {
    log_dir = make_temp_dir("logger_test");
    log_file = log_dir / "node.log";
    init_logging(log_file.string(), severity_level::trace);
  }

  void TearDown() override {
    // Ensure all logs are written
    boost::log::core::get()->flush();
    init_console_logging(severity_level::warning);
    std::error_code ec;
    std::filesystem::remove_all(log_dir, ec);
  }

  std::string log_content() {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::in | std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
  }
};

TEST_F(LoggerTest, BasicLogging) {
  LOG_INFO << "Test info message";
  LOG_ERROR << "Test error message";

  std::string content = log_content();
  EXPECT_NE(content.find("[info] Test info message"), std::string::npos);
  EXPECT_NE(content.find("[error] Test error message"), std::string::npos);
}

TEST_F(LoggerTest, TrivialLoggerSharesTheSink) {
  BOOST_LOG_TRIVIAL(warning) << "Publisher: Trivial message";
  EXPECT_NE(log_content().find("[warning] Publisher: Trivial message"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltering) {
  set_log_level(severity_level::warning);
  LOG_DEBUG << "filtered debug";
  LOG_WARN << "kept warning";

  std::string content = log_content();
  EXPECT_EQ(content.find("filtered debug"), std::string::npos);
  EXPECT_NE(content.find("kept warning"), std::string::npos);
}

TEST_F(LoggerTest, DisableAndEnable) {
  disable_logging();
  LOG_ERROR << "while disabled";
  enable_logging();
  LOG_ERROR << "after enable";

  std::string content = log_content();
  EXPECT_EQ(content.find("while disabled"), std::string::npos);
  EXPECT_NE(content.find("after enable"), std::string::npos);
}

TEST(SeverityParseTest, ParsesKnownLevels) {
  EXPECT_EQ(parse_severity("trace"), severity_level::trace);
  EXPECT_EQ(parse_severity("warning"), severity_level::warning);
  EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
  EXPECT_FALSE(parse_severity("loud").has_value());
  EXPECT_FALSE(parse_severity("").has_value());
}

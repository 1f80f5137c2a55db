#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace swarm::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path log_dir;
  std::filesystem::path log_file;

  void SetUp() override {
    log_dir = std::filesystem::temp_directory_path() /
      ("logger_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(log_dir);
    log_file = log_dir / "swarm-test.log";

    init_logging(log_file.string(), severity_level::trace);
  }

  void TearDown() override {
    shutdown_logging();
    if (std::filesystem::exists(log_dir)) {
      std::filesystem::remove_all(log_dir);
    }
  }

  bool log_contains(const std::string& text) {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
      return false;
    }
    std::stringstream content;
    content << file.rdbuf();
    return content.str().find(text) != std::string::npos;
  }
};

TEST_F(LoggerTest, WritesToLogFile) {
  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  EXPECT_TRUE(log_contains("Test info message"));
  EXPECT_TRUE(log_contains("Test error message"));
  EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, LevelFiltering) {
  set_log_level(severity_level::warning);
  BOOST_LOG_TRIVIAL(debug) << "Filtered debug message";
  BOOST_LOG_TRIVIAL(warning) << "Visible warning message";

  EXPECT_FALSE(log_contains("Filtered debug message"));
  EXPECT_TRUE(log_contains("Visible warning message"));
}

TEST_F(LoggerTest, ParseSeverity) {
  EXPECT_EQ(parse_severity("trace"), severity_level::trace);
  EXPECT_EQ(parse_severity("info"), severity_level::info);
  EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
  EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
  EXPECT_THROW(parse_severity(""), std::invalid_argument);
}

TEST_F(LoggerTest, ShutdownStopsFileOutput) {
  BOOST_LOG_TRIVIAL(info) << "Before shutdown message";
  EXPECT_TRUE(log_contains("Before shutdown message"));

  shutdown_logging();
  set_log_level(severity_level::fatal);
  BOOST_LOG_TRIVIAL(error) << "After shutdown message";

  EXPECT_FALSE(log_contains("After shutdown message"));
}

TEST_F(LoggerTest, LevelNamesSelectFilter) {
  set_log_level(parse_severity("error"));
  BOOST_LOG_TRIVIAL(warning) << "Below error threshold";
  BOOST_LOG_TRIVIAL(error) << "At error threshold";

  EXPECT_FALSE(log_contains("Below error threshold"));
  EXPECT_TRUE(log_contains("At error threshold"));
}

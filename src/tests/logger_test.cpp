#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace pmtorrent::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path log_dir;
  std::filesystem::path log_path;

  void SetUp() override {
    log_dir = std::filesystem::temp_directory_path() / "pmtorrent_logger_test";
    std::filesystem::remove_all(log_dir);
    std::filesystem::create_directories(log_dir);
    log_path = log_dir / "test.log";

    init_logging(log_path.string(), severity_level::trace);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    enable_logging();
    std::filesystem::remove_all(log_dir);
  }

  bool log_contains(const std::string& text) {
    boost::log::core::get()->flush();

    std::ifstream file(log_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
      return false;
    }
    std::stringstream content;
    content << file.rdbuf();
    return content.str().find(text) != std::string::npos;
  }
};

TEST_F(LoggerTest, BasicLogging) {
  PMTORRENT_LOG_INFO << "Test info message";
  PMTORRENT_LOG_ERROR << "Test error message";

  EXPECT_TRUE(log_contains("Test info message"));
  EXPECT_TRUE(log_contains("Test error message"));
}

TEST_F(LoggerTest, TrivialLoggerSharesSinks) {
  BOOST_LOG_TRIVIAL(info) << "Repository: trivial record";
  EXPECT_TRUE(log_contains("Repository: trivial record"));
  EXPECT_TRUE(log_contains("[info]"));
}

TEST_F(LoggerTest, ThreadLogging) {
  std::thread t([]() {
    PMTORRENT_LOG_INFO << "Message from thread";
  });
  t.join();

  EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, SeverityLevels) {
  PMTORRENT_LOG_TRACE << "Trace message";
  PMTORRENT_LOG_DEBUG << "Debug message";
  PMTORRENT_LOG_INFO << "Info message";
  PMTORRENT_LOG_WARN << "Warning message";
  PMTORRENT_LOG_ERROR << "Error message";
  PMTORRENT_LOG_FATAL << "Fatal message";

  EXPECT_TRUE(log_contains("Trace message"));
  EXPECT_TRUE(log_contains("Debug message"));
  EXPECT_TRUE(log_contains("Info message"));
  EXPECT_TRUE(log_contains("Warning message"));
  EXPECT_TRUE(log_contains("Error message"));
  EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(severity_level::warning);

  PMTORRENT_LOG_DEBUG << "Should not appear";
  PMTORRENT_LOG_WARN << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear"));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
  disable_logging();
  PMTORRENT_LOG_INFO << "Should not appear";

  enable_logging();
  PMTORRENT_LOG_INFO << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear"));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST(LoggerParseTest, ParseSeverity) {
  severity_level level = severity_level::info;
  EXPECT_TRUE(parse_severity("debug", level));
  EXPECT_EQ(level, severity_level::debug);
  EXPECT_TRUE(parse_severity("fatal", level));
  EXPECT_EQ(level, severity_level::fatal);

  EXPECT_FALSE(parse_severity("loud", level));
  EXPECT_EQ(level, severity_level::fatal);
}

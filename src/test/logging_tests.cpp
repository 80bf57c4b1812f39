// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

/**
 * Logging Tests
 */

#include <boost/test/unit_test.hpp>

#include <util/logging.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

/** Restores the process-wide logging configuration on scope exit. */
struct LoggingStateGuard {
    LogLevel level;
    std::string logFile;
    bool console;

    LoggingStateGuard() {
        CLoggingConfig& config = CLoggingConfig::GetInstance();
        level = config.GetLogLevel();
        logFile = config.GetLogFile();
        console = config.IsConsoleLoggingEnabled();
    }

    ~LoggingStateGuard() {
        CLogger::GetInstance().Shutdown();
        CLoggingConfig& config = CLoggingConfig::GetInstance();
        config.SetLogLevel(level);
        config.SetLogFile(logFile);
        config.SetConsoleLogging(console);
        config.EnableCategory(LogCategory::ALL);
    }
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

BOOST_AUTO_TEST_SUITE(logging_tests)

BOOST_AUTO_TEST_CASE(parse_level_names) {
    LogLevel level = LogLevel::LVL_INFO;
    BOOST_CHECK(ParseLogLevel("debug", level));
    BOOST_CHECK(level == LogLevel::LVL_DEBUG);
    BOOST_CHECK(ParseLogLevel("WARNING", level));
    BOOST_CHECK(level == LogLevel::LVL_WARN);
    BOOST_CHECK(ParseLogLevel("Error", level));
    BOOST_CHECK(level == LogLevel::LVL_ERROR);
    BOOST_CHECK(ParseLogLevel("info", level));
    BOOST_CHECK(level == LogLevel::LVL_INFO);

    BOOST_CHECK(!ParseLogLevel("verbose", level));
    BOOST_CHECK(level == LogLevel::LVL_INFO);
}

BOOST_AUTO_TEST_CASE(message_format) {
    std::string line = CLogger::FormatLogMsg(LogCategory::CODEC, LogLevel::LVL_INFO, "hello");
    BOOST_CHECK(line.find(" [INFO] [CODEC] hello") != std::string::npos);

    // YYYY-MM-DD HH:MM:SS prefix
    BOOST_REQUIRE(line.size() > 19);
    BOOST_CHECK_EQUAL(line[4], '-');
    BOOST_CHECK_EQUAL(line[10], ' ');
    BOOST_CHECK_EQUAL(line[13], ':');

    line = CLogger::FormatLogMsg(LogCategory::NONE, LogLevel::LVL_ERROR, "bare");
    BOOST_CHECK(line.find(" [ERROR] bare") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(category_switches) {
    LoggingStateGuard guard;
    CLoggingConfig& config = CLoggingConfig::GetInstance();

    config.DisableCategory(LogCategory::CONFIG);
    BOOST_CHECK(!config.IsCategoryEnabled(LogCategory::CONFIG));
    BOOST_CHECK(config.IsCategoryEnabled(LogCategory::CODEC));

    config.EnableCategory(LogCategory::CONFIG);
    BOOST_CHECK(config.IsCategoryEnabled(LogCategory::CONFIG));
}

BOOST_AUTO_TEST_CASE(file_logging_filters_by_level) {
    LoggingStateGuard guard;
    std::filesystem::path path = std::filesystem::temp_directory_path() / "bitwire_logging_tests.log";
    std::filesystem::remove(path);

    CLogger& logger = CLogger::GetInstance();
    logger.Shutdown();

    CLoggingConfig& config = CLoggingConfig::GetInstance();
    config.SetConsoleLogging(false);
    config.SetLogFile(path.string());
    config.SetLogLevel(LogLevel::LVL_WARN);
    BOOST_REQUIRE(logger.Initialize());

    LogPrintCodec(WARN, "kept %d", 1);
    LogPrintCodec(DEBUG, "dropped %d", 2);
    LogPrintTool(ERROR, "also kept");
    config.DisableCategory(LogCategory::TOOL);
    LogPrintTool(ERROR, "category off");
    logger.Shutdown();

    std::string contents = ReadFile(path);
    BOOST_CHECK(contents.find("[WARN] [CODEC] kept 1") != std::string::npos);
    BOOST_CHECK(contents.find("[ERROR] [TOOL] also kept") != std::string::npos);
    BOOST_CHECK(contents.find("dropped") == std::string::npos);
    BOOST_CHECK(contents.find("category off") == std::string::npos);

    std::filesystem::remove(path);
}

BOOST_AUTO_TEST_CASE(unwritable_log_file) {
    LoggingStateGuard guard;
    CLogger& logger = CLogger::GetInstance();
    logger.Shutdown();

    CLoggingConfig& config = CLoggingConfig::GetInstance();
    config.SetConsoleLogging(false);
    config.SetLogFile("/nonexistent-bitwire-dir/sub/debug.log");
    BOOST_CHECK(!logger.Initialize());
}

BOOST_AUTO_TEST_SUITE_END()

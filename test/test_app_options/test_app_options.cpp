#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "app_options.hpp"
#include "logger.hpp"
#include "progress_bar.hpp"
#include "user_input.hpp"

using calc::AppOptions;
using calc::Logger;
using calc::RunMode;

TEST(AppOptionsTest, Defaults) {
    AppOptions options = calc::parseOptions({}, "");
    EXPECT_EQ(RunMode::Interactive, options.mode);
    EXPECT_EQ(Logger::Level::Warn, options.logLevel);
    EXPECT_FALSE(options.showHelp);
}

TEST(AppOptionsTest, ModeWords) {
    EXPECT_EQ(RunMode::Batch, calc::parseOptions({ "batch" }, "").mode);
    EXPECT_EQ(RunMode::Generate, calc::parseOptions({ "generate" }, "").mode);
    EXPECT_EQ(RunMode::Interactive, calc::parseOptions({ "interactive" }, "").mode);
}

TEST(AppOptionsTest, FlagsOverrideEnvironment) {
    AppOptions fromEnv = calc::parseOptions({}, "info");
    EXPECT_EQ(Logger::Level::Info, fromEnv.logLevel);

    AppOptions verbose = calc::parseOptions({ "batch", "-v" }, "error");
    EXPECT_EQ(RunMode::Batch, verbose.mode);
    EXPECT_EQ(Logger::Level::Debug, verbose.logLevel);

    AppOptions quiet = calc::parseOptions({ "--quiet" }, "debug");
    EXPECT_EQ(Logger::Level::Error, quiet.logLevel);

    EXPECT_TRUE(calc::parseOptions({ "--help" }, "").showHelp);
}

TEST(AppOptionsTest, BadArguments) {
    const std::vector<std::string> twoModes = { "batch", "generate" };
    EXPECT_THROW(calc::parseOptions({ "--fast" }, ""), std::runtime_error);
    EXPECT_THROW(calc::parseOptions(twoModes, ""), std::runtime_error);
    EXPECT_THROW(calc::parseOptions({}, "loud"), std::runtime_error);
}

TEST(AppOptionsTest, LogLevelNames) {
    EXPECT_EQ(Logger::Level::Debug, Logger::parseLevel("DEBUG"));
    EXPECT_EQ(Logger::Level::Warn, Logger::parseLevel("warning"));
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_FALSE(Logger::parseLevel("отладка").has_value());
    EXPECT_FALSE(Logger::parseLevel("d\xE9" "bug").has_value());
    EXPECT_STREQ("ERROR", Logger::levelName(Logger::Level::Error));
}

TEST(AppOptionsTest, LoggerThreshold) {
    Logger::setLevel(Logger::Level::Info);
    EXPECT_EQ(Logger::Level::Info, Logger::level());
    EXPECT_TRUE(Logger::enabled(Logger::Level::Info));
    EXPECT_FALSE(Logger::enabled(Logger::Level::Debug));

    Logger::setLevel(Logger::Level::Warn);
    EXPECT_EQ(Logger::Level::Warn, Logger::level());
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Warn));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));
}

TEST(AppOptionsTest, UsageMentionsModes) {
    std::string text = calc::usage("keycalc");
    EXPECT_NE(std::string::npos, text.find("keycalc [interactive|batch|generate]"));
    EXPECT_NE(std::string::npos, text.find(calc::kLogLevelEnv));
}

TEST(AppOptionsTest, ParseCount) {
    EXPECT_EQ(8u, calc::parseCount("8"));
    EXPECT_EQ(100000u, calc::parseCount("100000"));
    EXPECT_THROW(calc::parseCount("0"), std::runtime_error);
    EXPECT_THROW(calc::parseCount("abc"), std::runtime_error);
    EXPECT_THROW(calc::parseCount("12x"), std::runtime_error);
    EXPECT_THROW(calc::parseCount(""), std::runtime_error);
}

TEST(AppOptionsTest, OutputPaths) {
    std::filesystem::path output = calc::defaultOutputPath("sessions/daily.txt", "20240101_120000");
    EXPECT_EQ("daily_results_20240101_120000.csv", output.filename().string());
    EXPECT_EQ("sessions", output.parent_path().string());

    EXPECT_EQ("report.csv", calc::ensureExtension("report", ".csv").string());
    EXPECT_EQ("report.csv", calc::ensureExtension("report.txt", ".csv").string());
    EXPECT_EQ("report.csv", calc::ensureExtension("report.csv", ".csv").string());
}

TEST(AppOptionsTest, RenderProgress) {
    EXPECT_EQ("[██▒░] 50% (5/10)", calc::renderProgress(5, 10, 4));
    EXPECT_EQ("[▒░░░] 0% (0/10)", calc::renderProgress(0, 10, 4));
    EXPECT_EQ("[████] 100% (10/10)", calc::renderProgress(10, 10, 4));
    EXPECT_EQ("[████] 100% (0/0)", calc::renderProgress(0, 0, 4));
}

#include <gtest/gtest.h>

#include "valkyrie/cli_colors.hpp"
#include "valkyrie/log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace valkyrie;

class ConsoleLoggerTest : public ::testing::Test {
protected:
    void SetUp() override { cli::SetColorsEnabled(false); }
};

TEST_F(ConsoleLoggerTest, FormatsLines) {
    std::ostringstream out;
    log::ConsoleLogger logger("unit", log::Level::Debug, out);
    logger.Info("hello");
    logger.Warning("careful");
    EXPECT_EQ(out.str(), "INFO    | unit | hello\nWARNING | unit | careful\n");
}

TEST_F(ConsoleLoggerTest, FiltersBelowThreshold) {
    std::ostringstream out;
    log::ConsoleLogger logger("unit", log::Level::Warning, out);
    logger.Debug("hidden");
    logger.Info("hidden");
    logger.Error("shown");
    EXPECT_EQ(out.str(), "ERROR   | unit | shown\n");
    logger.set_level(log::Level::Debug);
    logger.Debug("now visible");
    EXPECT_NE(out.str().find("DEBUG   | unit | now visible"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, MirrorsToFile) {
    auto path = std::filesystem::temp_directory_path() / "valkyrie_log_test" / "run.log";
    std::filesystem::remove(path);
    {
        std::ostringstream out;
        log::ConsoleLogger logger("file", log::Level::Info, out, path);
        logger.Info("persisted");
    }
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "INFO    | file | persisted");
    std::filesystem::remove_all(path.parent_path());
}

TEST_F(ConsoleLoggerTest, ColorsWrapLineWhenEnabled) {
    cli::SetColorsEnabled(true);
    std::ostringstream out;
    log::ConsoleLogger logger("unit", log::Level::Info, out);
    logger.Error("red");
    EXPECT_EQ(out.str().rfind(cli::color::BOLD_RED, 0), 0u);
    EXPECT_NE(out.str().find(cli::color::RESET), std::string::npos);
    cli::SetColorsEnabled(false);
}

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(log::LevelName(log::Level::Warning), "warning");
    EXPECT_EQ(log::TryLevelFromName("debug"), log::Level::Debug);
    EXPECT_EQ(log::TryLevelFromName("error"), log::Level::Error);
    EXPECT_FALSE(log::TryLevelFromName("critical").has_value());
}

TEST(LogLevelTest, NullLoggerAcceptsEverything) {
    log::NullLogger logger;
    logger.Error("discarded");
    logger.Debug("discarded");
    SUCCEED();
}

#include <gtest/gtest.h>

#include "convo/log.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace
{

class LogTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        path_ = std::filesystem::temp_directory_path() /
                ("convo_log_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log");
        convo::log::setLogFile(path_);
        convo::log::setThreshold(convo::log::Level::Info);
    }

    void TearDown() override
    {
        convo::log::setLogFile({});
        convo::log::setThreshold(convo::log::Level::Info);
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string contents() const
    {
        std::ifstream in(path_);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::filesystem::path path_;
};

} // namespace

TEST_F(LogTest, AppendsLevelTaggedLines)
{
    convo::log::info("Loaded page 0");
    convo::log::error("Unable to open history.json");

    const std::string text = contents();
    EXPECT_NE(text.find("[INFO] Loaded page 0\n"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] Unable to open history.json\n"), std::string::npos);
    EXPECT_EQ(convo::log::logFile().string(), path_.string());
}

TEST_F(LogTest, DropsLinesBelowThreshold)
{
    convo::log::debug("hidden");
    EXPECT_EQ(contents().find("hidden"), std::string::npos);

    convo::log::setThreshold(convo::log::Level::Debug);
    convo::log::debug("visible");
    EXPECT_NE(contents().find("[DEBUG] visible"), std::string::npos);
}

TEST_F(LogTest, SettingTheFileTruncatesIt)
{
    convo::log::warning("first run");
    convo::log::setLogFile(path_);
    EXPECT_TRUE(contents().empty());
}

TEST_F(LogTest, EmptyPathDisablesLogging)
{
    convo::log::setLogFile({});
    convo::log::info("nowhere");
    convo::log::setLogFile(path_);
    convo::log::info("somewhere");
    EXPECT_EQ(contents().find("nowhere"), std::string::npos);
    EXPECT_NE(contents().find("somewhere"), std::string::npos);
}

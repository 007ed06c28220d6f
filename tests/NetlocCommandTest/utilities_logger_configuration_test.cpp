//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#include <gtest/gtest.h>

#include <fmt/xchar.h>

#include "Log/Log.h"
#include "Log/UtilitiesLogger.h"
#include "Log/UtilitiesLoggerConfiguration.h"

using namespace std::string_literals;

using namespace Netloc;
using namespace Netloc::Command;

namespace fs = std::filesystem;

namespace Netloc::Test {

class UtilitiesLoggerConfigurationTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::random_device device;
        directory = fs::temp_directory_path() / fs::path(fmt::format(L"netloc-command-{:08x}", device()));
        fs::create_directories(directory);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(directory, ec);
    }

    template <size_t N>
    static UtilitiesLoggerConfiguration Parse(const wchar_t* (&argv)[N])
    {
        UtilitiesLoggerConfiguration config;
        UtilitiesLoggerConfiguration::Parse(static_cast<int>(N), argv, config);
        return config;
    }

    fs::path directory;
};

TEST_F(UtilitiesLoggerConfigurationTest, ParseDefaults)
{
    const wchar_t* argv[] = {L"Netloc.exe", L"/list", L"/info=\\\\server\\data", L"shortcuts"};
    const auto config = Parse(argv);

    EXPECT_FALSE(config.level.has_value());
    EXPECT_FALSE(config.verbose.has_value());
    EXPECT_FALSE(config.logFile.has_value());
    EXPECT_FALSE(config.console.level.has_value());
    EXPECT_FALSE(config.file.level.has_value());
    EXPECT_FALSE(config.file.path.has_value());
    EXPECT_FALSE(UtilitiesLoggerConfiguration::ToCommandLineArguments(config).has_value());
}

TEST_F(UtilitiesLoggerConfigurationTest, ParseLevelSwitches)
{
    {
        const wchar_t* argv[] = {L"Netloc.exe", L"/Debug"};
        EXPECT_EQ(Parse(argv).level, Log::Level::Debug);
    }

    {
        const wchar_t* argv[] = {L"Netloc.exe", L"-trace"};
        EXPECT_EQ(Parse(argv).level, Log::Level::Trace);
    }

    {
        const wchar_t* argv[] = {L"Netloc.exe", L"/quiet"};
        EXPECT_EQ(Parse(argv).level, Log::Level::Critical);
    }

    {
        const wchar_t* argv[] = {L"Netloc.exe", L"/warn=1", L"/info"};
        EXPECT_FALSE(Parse(argv).level.has_value());
    }
}

TEST_F(UtilitiesLoggerConfigurationTest, ParseLogOptions)
{
    const wchar_t* argv[] = {
        L"Netloc.exe",
        L"/verbose",
        L"/log:console,level=error",
        L"/log:file,output=netloc.log,level=trace",
        L"/logfile=legacy.log"};

    const auto config = Parse(argv);

    EXPECT_EQ(config.verbose, true);
    EXPECT_EQ(config.console.level, Log::Level::Error);
    EXPECT_EQ(config.file.level, Log::Level::Trace);
    EXPECT_EQ(config.file.path, L"netloc.log"s);
    EXPECT_EQ(config.logFile, fs::path(L"legacy.log"));
}

TEST_F(UtilitiesLoggerConfigurationTest, ToCommandLineArguments)
{
    UtilitiesLoggerConfiguration config;
    config.level = Log::Level::Debug;
    config.console.level = Log::Level::Warning;
    config.file.path = L"netloc.log";

    const auto arguments = UtilitiesLoggerConfiguration::ToCommandLineArguments(config);
    ASSERT_TRUE(arguments.has_value());
    EXPECT_EQ(*arguments, L"/debug /log:console,level=warning /log:file,output=netloc.log"s);

    const wchar_t* argv[] = {L"Netloc.exe", L"/debug", L"/log:console,level=warning", L"/log:file,output=netloc.log"};
    const auto parsed = Parse(argv);
    EXPECT_EQ(parsed.level, config.level);
    EXPECT_EQ(parsed.console.level, config.console.level);
    EXPECT_EQ(parsed.file.path, config.file.path);
}

TEST_F(UtilitiesLoggerConfigurationTest, ApplyFileOutput)
{
    const auto path = directory / L"netloc.log";

    {
        UtilitiesLogger logger;
        Log::Info("Before configuration");

        UtilitiesLoggerConfiguration config;
        config.file.path = path.wstring();
        config.file.level = Log::Level::Debug;

        auto rv = UtilitiesLoggerConfiguration::Apply(logger, config);
        ASSERT_TRUE(rv.has_value());

        EXPECT_TRUE(logger.fileSink()->IsOpen());
        EXPECT_EQ(logger.fileSink()->Level(), Log::Level::Debug);
        EXPECT_EQ(logger.consoleSink()->Level(), Log::Level::Critical);

        Log::Debug(L"Shortcut '{}' resolved", L"Data");
        Log::Trace("Filtered by the file sink");
        logger.fileSink()->Close();
    }

    EXPECT_EQ(Log::DefaultLogger(), nullptr);

    std::ifstream file(path, std::ios::in | std::ios::binary);
    const std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    EXPECT_NE(content.find("[I] Before configuration"), std::string::npos) << content;
    EXPECT_NE(content.find("[D] Shortcut 'Data' resolved"), std::string::npos) << content;
    EXPECT_EQ(content.find("Filtered by the file sink"), std::string::npos) << content;
}

TEST_F(UtilitiesLoggerConfigurationTest, ApplyWithoutFileOutput)
{
    UtilitiesLogger logger;

    UtilitiesLoggerConfiguration config;
    config.verbose = true;

    auto rv = UtilitiesLoggerConfiguration::Apply(logger, config);
    ASSERT_TRUE(rv.has_value());

    EXPECT_FALSE(logger.fileSink()->IsOpen());
    EXPECT_EQ(logger.fileSink()->Level(), Log::Level::Off);
    EXPECT_EQ(logger.consoleSink()->Level(), Log::Level::Debug);
}

TEST_F(UtilitiesLoggerConfigurationTest, ApplyInvalidFileOutput)
{
    UtilitiesLogger logger;

    UtilitiesLoggerConfiguration config;
    config.file.path = (directory / L"missing" / L"netloc.log").wstring();

    auto rv = UtilitiesLoggerConfiguration::Apply(logger, config);
    EXPECT_TRUE(rv.has_error());
    EXPECT_EQ(logger.logger().errorCount(), 1u);
}

}  // namespace Netloc::Test

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "Log/UtilitiesLoggerConfiguration.h"

#include <algorithm>
#include <array>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <spdlog/cfg/env.h>

#include "Configuration/Option.h"
#include "Log/Log.h"

using namespace Netloc::Command;
using namespace Netloc;
using namespace std::literals;

namespace {

constexpr auto kLog = L"log"sv;
constexpr auto kLevel = L"level"sv;
constexpr auto kLogFile = L"logfile"sv;
constexpr auto kOutput = L"output"sv;
constexpr auto kVerbose = L"verbose"sv;
constexpr auto kNoConsole = L"noconsole"sv;
constexpr auto kConsole = L"console"sv;
constexpr auto kFile = L"file"sv;

struct LevelSwitch
{
    std::wstring_view name;
    Log::Level level;
};

// '/info' is left to the command which uses it to select a single location
constexpr std::array<LevelSwitch, 7> kLevelSwitches = {{
    {L"quiet"sv, Log::Level::Critical},
    {L"critical"sv, Log::Level::Critical},
    {L"error"sv, Log::Level::Error},
    {L"warn"sv, Log::Level::Warning},
    {L"warning"sv, Log::Level::Warning},
    {L"debug"sv, Log::Level::Debug},
    {L"trace"sv, Log::Level::Trace},
}};

void ParseLevelOption(Option& option, std::optional<Log::Level>& level)
{
    if (option.isParsed || option.key != kLevel || !option.value)
    {
        return;
    }

    auto parsed = Log::ToLevel(*option.value);
    if (!parsed)
    {
        Log::Error(L"Failed to parse log level: {} [{}]", *option.value, parsed.error());
        return;
    }

    level = *parsed;
    option.isParsed = true;
}

void ParseOutputOption(Option& option, std::optional<std::wstring>& path)
{
    if (option.isParsed || option.key != kOutput || !option.value)
    {
        return;
    }

    path = *option.value;
    option.isParsed = true;
}

// Handle '/log:console,level=...' or '/log:file,output=...,level=...', any unknown sub-option rejects the argument
bool ParseLogArgument(std::wstring_view input, UtilitiesLoggerConfiguration& config)
{
    std::vector<Option> options;
    if (!ParseSubArguments(input, kLog, options) || options.empty())
    {
        return false;
    }

    auto& sink = options.front();
    if (sink.key == kConsole)
    {
        std::for_each(std::next(std::begin(options)), std::end(options), [&](Option& option) {
            ParseLevelOption(option, config.console.level);
        });

        sink.isParsed = true;
    }
    else if (sink.key == kFile)
    {
        std::for_each(std::next(std::begin(options)), std::end(options), [&](Option& option) {
            ParseOutputOption(option, config.file.path);
            ParseLevelOption(option, config.file.level);
        });

        sink.isParsed = config.file.path.has_value();
    }
    else
    {
        Log::Error(L"Unknown log sink: '{}'", sink.key);
        return false;
    }

    return std::all_of(std::cbegin(options), std::cend(options), [](const Option& option) { return option.isParsed; });
}

std::optional<Log::Level> ParseLevelSwitch(std::wstring_view input)
{
    for (const auto& levelSwitch : kLevelSwitches)
    {
        std::optional<std::wstring> value;
        if (ParseSwitch(input, levelSwitch.name, value) && !value)
        {
            return levelSwitch.level;
        }
    }

    return {};
}

Log::Level ConsoleLevel(const UtilitiesLoggerConfiguration& config)
{
    if (config.console.level)
    {
        return *config.console.level;
    }

    if (config.level)
    {
        return *config.level;
    }

    return config.verbose.value_or(false) ? Log::Level::Debug : Log::Level::Critical;
}

Log::Level FileLevel(const UtilitiesLoggerConfiguration& config)
{
    return config.file.level.value_or(config.level.value_or(Log::Level::Info));
}

std::optional<std::filesystem::path> FilePath(const UtilitiesLoggerConfiguration& config)
{
    if (config.file.path)
    {
        return std::filesystem::path(*config.file.path);
    }

    return config.logFile;
}

void ApplyLevels(UtilitiesLogger& logger, const UtilitiesLoggerConfiguration& config)
{
    logger.consoleSink()->SetLevel(ConsoleLevel(config));
    logger.fileSink()->SetLevel(FileLevel(config));
}

// Forward records down to debug at least so that a sink raised later by SPDLOG_LEVEL still receives them
void ApplyUpstreamLevel(UtilitiesLogger& logger)
{
    logger.SetUpstreamLevel(std::min({logger.consoleSink()->Level(), logger.fileSink()->Level(), Log::Level::Debug}));
}

std::wstring SinkArgument(std::wstring_view sink, const std::vector<Option>& options)
{
    return fmt::format(L"/{}:{}{}", kLog, sink, Join(options, L",", L"", L""));
}

}  // namespace

namespace Netloc {
namespace Command {

// Parse argv directly so that logging is configured before the command parses its own arguments
void UtilitiesLoggerConfiguration::Parse(int argc, const wchar_t* argv[], UtilitiesLoggerConfiguration& config)
{
    for (int i = 0; i < argc; i++)
    {
        const auto arg = ToSwitch(argv[i]);
        if (!arg || ParseLogArgument(*arg, config))
        {
            continue;
        }

        if (const auto level = ParseLevelSwitch(*arg))
        {
            config.level = level;
            continue;
        }

        std::optional<std::wstring> value;
        if (ParseSwitch(*arg, kVerbose, value))
        {
            config.verbose = true;
        }
        else if (ParseSwitch(*arg, kNoConsole, value))
        {
            config.verbose = false;
        }
        else if (ParseSwitch(*arg, kLogFile, value))
        {
            if (!value || value->empty())
            {
                Log::Error(L"Missing path for /{}, expected /{}=<path>", kLogFile, kLogFile);
                continue;
            }

            config.logFile = *value;
        }
    }
}

Netloc::Result<void> UtilitiesLoggerConfiguration::Apply(UtilitiesLogger& logger, const UtilitiesLoggerConfiguration& config)
{
    ApplyLevels(logger, config);

    if (const auto path = FilePath(config))
    {
        std::error_code ec;
        logger.fileSink()->Open(*path, ec);
        if (ec)
        {
            Log::Error(L"Failed to open log file: '{}' [{}]", path->wstring(), ec);
            return ec;
        }
    }
    else
    {
        // Records buffered until now are dropped with the sink
        logger.fileSink()->SetLevel(Log::Level::Off);
    }

    ApplyUpstreamLevel(logger);

    // SPDLOG_LEVEL (ex: "SPDLOG_LEVEL=info,file=trace") overrides sink levels, 'config' does not reflect it
    spdlog::cfg::load_env_levels();

    return Success();
}

std::optional<std::wstring> UtilitiesLoggerConfiguration::ToCommandLineArguments(const UtilitiesLoggerConfiguration& config)
{
    std::vector<std::wstring> arguments;

    if (config.logFile)
    {
        arguments.push_back(fmt::format(L"/{}={}", kLogFile, config.logFile->wstring()));
    }

    if (config.level)
    {
        arguments.push_back(fmt::format(L"/{}", Log::ToString(*config.level)));
    }

    if (config.verbose.value_or(false))
    {
        arguments.push_back(fmt::format(L"/{}", kVerbose));
    }

    if (config.console.level)
    {
        arguments.push_back(SinkArgument(kConsole, {Option(kLevel, Log::ToString(*config.console.level))}));
    }

    std::vector<Option> fileOptions;
    if (config.file.level)
    {
        fileOptions.emplace_back(kLevel, Log::ToString(*config.file.level));
    }

    if (config.file.path)
    {
        fileOptions.emplace_back(kOutput, *config.file.path);
    }

    if (!fileOptions.empty())
    {
        arguments.push_back(SinkArgument(kFile, fileOptions));
    }

    if (arguments.empty())
    {
        return {};
    }

    return boost::algorithm::join(arguments, L" ");
}

}  // namespace Command
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2011-2019 ANSSI. All Rights Reserved.
//
// Author(s): Jean Gautier (ANSSI)
//

#include "UtilitiesMain.h"

#include <array>
#include <ctime>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <fmt/chrono.h>

#include "Configuration/Option.h"
#include "ToolVersion.h"

using namespace std::literals;

using namespace Netloc;
using namespace Netloc::Command;

namespace {

std::wstring ToUtcString(const std::chrono::system_clock::time_point& timepoint)
{
    const auto time = std::chrono::system_clock::to_time_t(timepoint);
    return fmt::format(L"{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(time));
}

}  // namespace

UtilitiesMain::UtilitiesMain()
    : m_console(stdout)
    , m_errorConsole(stderr)
    , theStartTime()
    , theFinishTime()
    , m_usageRequested(false)
{
}

void UtilitiesMain::Configure(int argc, const wchar_t* argv[])
{
    UtilitiesLoggerConfiguration::Parse(argc, argv, m_loggingConfig);

    auto rv = UtilitiesLoggerConfiguration::Apply(m_logging, m_loggingConfig);
    if (!rv)
    {
        Log::Error(L"Failed to apply logging configuration [{}]", rv.error());
    }
}

void UtilitiesMain::PrintHeader(std::wstring_view toolName, std::wstring_view toolDescription)
{
    if (!toolName.empty())
    {
        m_errorConsole.Print(L"{} {} ({})", toolName, kNetlocVersionStringW, kProductNameStringW);
        m_errorConsole.PrintNewLine();
    }

    if (!toolDescription.empty())
    {
        m_errorConsole.Print(L"{}", toolDescription);
        m_errorConsole.PrintNewLine();
    }
}

void UtilitiesMain::PrintCommonUsage()
{
    m_console.Print(
        L"\t/verbose                    : Set console log level to 'debug'\n"
        L"\t/quiet                      : Only log critical messages\n"
        L"\t/critical, /error, /warn, /debug, /trace\n"
        L"\t                            : Set log level of every sink\n"
        L"\t/noconsole                  : Disable '/verbose'\n"
        L"\t/log:console,level=<level>  : Console sink configuration\n"
        L"\t/log:file,output=<path>,level=<level>\n"
        L"\t                            : File sink configuration\n"
        L"\t/logfile=<path>             : Log into the given file\n"
        L"\t/?, /help                   : Print this help\n"
        L"\n"
        L"\tLog levels are: trace, debug, info, warning, error, critical, off\n"
        L"\tSPDLOG_LEVEL environment variable overrides the levels (ex: 'SPDLOG_LEVEL=default=trace')");
}

void UtilitiesMain::PrintCommonParameters()
{
    m_errorConsole.PrintValue(1, L"Start time", ToUtcString(theStartTime));

    const auto logging = UtilitiesLoggerConfiguration::ToCommandLineArguments(m_loggingConfig);
    m_errorConsole.PrintValue(1, L"Logging", logging ? *logging : std::wstring(kNoneAvailableW));

    const auto& logFile = m_logging.fileSink()->OutputPath();
    m_errorConsole.PrintValue(1, L"Log file", logFile ? logFile->wstring() : std::wstring(kNoneAvailableW));
}

void UtilitiesMain::PrintCommonFooter()
{
    m_errorConsole.PrintValue(1, L"Warning(s)", m_logging.logger().warningCount());
    m_errorConsole.PrintValue(1, L"Error(s)", m_logging.logger().errorCount());
    m_errorConsole.PrintValue(1, L"Critical error(s)", m_logging.logger().criticalCount());

    m_errorConsole.PrintValue(1, L"Finish time", ToUtcString(theFinishTime));

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(theFinishTime - theStartTime);

    const auto msecs = elapsed.count() % 1000;
    const auto secs = (elapsed.count() / 1000) % 60;
    const auto mins = (elapsed.count() / (1000 * 60)) % 60;
    const auto hours = elapsed.count() / (1000 * 60 * 60);

    std::vector<std::wstring> durations;
    if (hours)
    {
        durations.push_back(fmt::format(L"{} hour(s)", hours));
    }

    if (mins)
    {
        durations.push_back(fmt::format(L"{} min(s)", mins));
    }

    if (secs)
    {
        durations.push_back(fmt::format(L"{} sec(s)", secs));
    }

    durations.push_back(fmt::format(L"{} msecs", msecs));

    m_errorConsole.PrintValue(1, L"Elapsed time", boost::join(durations, L", "));
}

bool UtilitiesMain::UsageOption(std::wstring_view arg)
{
    constexpr std::array kUsageOptions = {L"?"sv, L"h"sv, L"help"sv};
    for (const auto& option : kUsageOptions)
    {
        if (boost::iequals(arg, option))
        {
            PrintUsage();
            m_usageRequested = true;
            return true;
        }
    }

    return false;
}

bool UtilitiesMain::IgnoreLoggingOptions(std::wstring_view arg)
{
    // Already handled by UtilitiesLoggerConfiguration::Parse
    constexpr std::array kLoggingOptions = {
        L"verbose"sv,
        L"quiet"sv,
        L"trace"sv,
        L"debug"sv,
        L"warn"sv,
        L"warning"sv,
        L"error"sv,
        L"critical"sv,
        L"noconsole"sv,
        L"logfile"sv};

    std::optional<std::wstring> value;
    for (const auto& option : kLoggingOptions)
    {
        if (ParseSwitch(arg, option, value))
        {
            return true;
        }
    }

    return boost::istarts_with(arg, L"log:"sv);
}

bool UtilitiesMain::IgnoreCommonOptions(std::wstring_view arg)
{
    return IgnoreLoggingOptions(arg);
}

bool UtilitiesMain::ParameterOption(
    std::wstring_view arg,
    std::wstring_view option,
    std::optional<std::wstring>& parameter)
{
    std::optional<std::wstring> value;
    if (!ParseSwitch(arg, option, value))
    {
        return false;
    }

    if (!value)
    {
        Log::Error(L"Option /{} should be like: /{}=<Value>", option, option);
        return false;
    }

    parameter = std::move(value);
    return true;
}

bool UtilitiesMain::BooleanOption(std::wstring_view arg, std::wstring_view option, bool& value)
{
    std::optional<std::wstring> parameter;
    if (!ParseSwitch(arg, option, parameter))
    {
        return false;
    }

    if (!parameter)
    {
        value = true;
        return true;
    }

    if (boost::iequals(*parameter, L"yes"sv) || boost::iequals(*parameter, L"true"sv))
    {
        value = true;
        return true;
    }

    if (boost::iequals(*parameter, L"no"sv) || boost::iequals(*parameter, L"false"sv))
    {
        value = false;
        return true;
    }

    Log::Error(L"Option /{} should be like: /{}=<yes|no>", option, option);
    return false;
}

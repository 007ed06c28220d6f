//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2011-2019 ANSSI. All Rights Reserved.
//
// Author(s): Jean Gautier (ANSSI)
//
#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>

#include "Log/Log.h"
#include "Log/UtilitiesLogger.h"
#include "Log/UtilitiesLoggerConfiguration.h"
#include "Output/Console.h"
#include "Utils/Result.h"

namespace Netloc {
namespace Command {

class UtilitiesMain
{
public:
    class Configuration
    {
    };

    UtilitiesMain();
    virtual ~UtilitiesMain() = default;

    virtual void PrintUsage() = 0;
    virtual void PrintParameters() = 0;
    virtual void PrintFooter() = 0;

    virtual Result<void> GetConfigurationFromArgcArgv(int argc, const wchar_t* argv[]) = 0;
    virtual Result<void> CheckConfiguration() = 0;

    virtual Result<void> Run() = 0;

    template <class UtilityT>
    static int WMain(int argc, const wchar_t* argv[])
    {
        UtilityT Cmd;
        Cmd.Configure(argc, argv);

        Cmd.PrintHeader(UtilityT::ToolName(), UtilityT::ToolDescription());

        try
        {
            auto rv = Cmd.GetConfigurationFromArgcArgv(argc, argv);
            if (!rv)
            {
                Log::Critical(L"Failed to parse command line arguments [{}]", rv.error());
                return EXIT_FAILURE;
            }

            if (Cmd.m_usageRequested)
            {
                return EXIT_SUCCESS;
            }

            rv = Cmd.CheckConfiguration();
            if (!rv)
            {
                Log::Critical(L"Failed while checking configuration [{}]", rv.error());
                return EXIT_FAILURE;
            }
        }
        catch (const std::exception& e)
        {
            Log::Critical("Exception during configuration evaluation. Type: {}, Reason: {}", typeid(e).name(), e.what());
            return EXIT_FAILURE;
        }

        Cmd.theStartTime = std::chrono::system_clock::now();

        // Parameters are displayed when the configuration is complete and checked
        Cmd.PrintParameters();

        try
        {
            auto rv = Cmd.Run();
            if (!rv)
            {
                Log::Critical(L"Command failed with {}", rv.error());
                Log::Flush();
                return rv.error().value() != 0 ? rv.error().value() : EXIT_FAILURE;
            }
        }
        catch (const std::exception& e)
        {
            Log::Critical("Exception during execution. Type: {}, Reason: {}", typeid(e).name(), e.what());
            Log::Flush();
            return EXIT_FAILURE;
        }

        Cmd.theFinishTime = std::chrono::system_clock::now();
        Cmd.PrintFooter();

        Log::Flush();
        return Cmd.m_logging.logger().criticalCount() ? EXIT_FAILURE : EXIT_SUCCESS;
    }

protected:
    UtilitiesLogger m_logging;
    UtilitiesLoggerConfiguration m_loggingConfig;
    Console m_console;
    Console m_errorConsole;

    std::chrono::system_clock::time_point theStartTime;
    std::chrono::system_clock::time_point theFinishTime;

    bool m_usageRequested;

    // Apply logging options as soon as possible so configuration parsing can be logged
    void Configure(int argc, const wchar_t* argv[]);

    void PrintHeader(std::wstring_view toolName, std::wstring_view toolDescription);
    void PrintCommonUsage();
    void PrintCommonParameters();
    void PrintCommonFooter();

    // '/?', '/h' or '/help': print usage, the command is not run
    bool UsageOption(std::wstring_view arg);

    bool IgnoreLoggingOptions(std::wstring_view arg);
    bool IgnoreCommonOptions(std::wstring_view arg);

    // Match '/option=<value>', a missing value is logged as an error
    static bool ParameterOption(std::wstring_view arg, std::wstring_view option, std::optional<std::wstring>& parameter);
    static bool BooleanOption(std::wstring_view arg, std::wstring_view option, bool& value);
};

}  // namespace Command
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "NetworkLocations.h"

#include "Configuration/Option.h"
#include "KnownFolders.h"
#include "NetworkLocationError.h"
#include "UncPath.h"

using namespace Netloc;
using namespace Netloc::Command::NetworkLocations;

Result<void> Main::GetConfigurationFromArgcArgv(int argc, const wchar_t* argv[])
{
    // Configuration is completed with command line args

    for (int i = 1; i < argc; i++)
    {
        const auto arg = ToSwitch(argv[i]);
        if (!arg)
        {
            Log::Warn(L"Ignored argument: '{}'", argv[i]);
            continue;
        }

        std::optional<std::wstring> value;
        std::optional<std::wstring> shortcuts;

        if (ParseSwitch(*arg, L"list", value) && !value)
        {
            config.action = Action::List;
        }
        else if (ParameterOption(*arg, L"info", config.uncPath))
        {
            config.action = Action::Info;
        }
        else if (ParameterOption(*arg, L"label", config.uncPath))
        {
            config.action = Action::Label;
        }
        else if (ParameterOption(*arg, L"rename", config.newLabel))
            ;
        else if (ParameterOption(*arg, L"shortcuts", shortcuts))
        {
            config.shortcuts = std::filesystem::path(*shortcuts);
        }
        else if (BooleanOption(*arg, L"record", config.record))
            ;
        else if (UsageOption(*arg))
        {
            return Success();
        }
        else if (IgnoreCommonOptions(*arg))
            ;
        else
        {
            Log::Error(L"Unknown option: '{}'", argv[i]);
            PrintUsage();
            return std::make_error_code(std::errc::invalid_argument);
        }
    }

    return Success();
}

Result<void> Main::CheckConfiguration()
{
    if (config.newLabel && config.action != Action::Label)
    {
        Log::Error(L"Option /rename requires /label=<unc>");
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (config.action == Action::Label && !config.newLabel)
    {
        Log::Error(L"Option /label requires /rename=<label>");
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (config.uncPath)
    {
        auto uncPath = UncPath::Parse(*config.uncPath);
        if (!uncPath)
        {
            Log::Error(L"Invalid UNC path: '{}' [{}]", *config.uncPath, uncPath.error());
            return uncPath.error();
        }
    }

    if (!config.shortcuts)
    {
        auto shortcuts = KnownFolders::NetworkShortcuts();
        if (!shortcuts)
        {
            Log::Error(L"Failed to locate network shortcuts folder [{}]", shortcuts.error());
            return shortcuts.error();
        }

        config.shortcuts = std::move(*shortcuts);
    }

    return Success();
}

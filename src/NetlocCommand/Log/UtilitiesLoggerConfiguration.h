//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include "Log/UtilitiesLogger.h"

#include <filesystem>
#include <optional>
#include <string>

#include "Utils/Result.h"

namespace Netloc {
namespace Command {

struct UtilitiesLoggerConfiguration
{
    static void Parse(int argc, const wchar_t* argv[], UtilitiesLoggerConfiguration& config);

    static Result<void> Apply(UtilitiesLogger& logger, const UtilitiesLoggerConfiguration& config);

    static std::optional<std::wstring> ToCommandLineArguments(const UtilitiesLoggerConfiguration& config);

    struct Output
    {
        std::optional<Netloc::Log::Level> level;
    };

    struct FileOutput : Output
    {
        std::optional<std::wstring> path;
    };

    // Level switches like '/debug', applied to every sink without a level of its own
    std::optional<Netloc::Log::Level> level;
    std::optional<bool> verbose;
    std::optional<std::filesystem::path> logFile;  // '/logfile=<path>', same as '/log:file,output=<path>'

    // '/log:console,...' and '/log:file,...'
    Output console;
    FileOutput file;
};

}  // namespace Command
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "UtilitiesMain.h"

#include "NetworkLocation.h"
#include "NetworkLocationResolver.h"

namespace Netloc {
namespace Command::NetworkLocations {

class Main : public UtilitiesMain
{
public:
    enum class Action
    {
        List,
        Info,
        Label
    };

    class Configuration : public UtilitiesMain::Configuration
    {
    public:
        Configuration()
            : action(Action::List)
            , record(false)
        {
        }

        Action action;

        // Location targeted by '/info' or '/label'
        std::optional<std::wstring> uncPath;
        std::optional<std::wstring> newLabel;

        std::optional<std::filesystem::path> shortcuts;
        bool record;
    };

    static const wchar_t* ToolName() { return L"Netloc"; }
    static const wchar_t* ToolDescription() { return L"Network locations shortcuts resolution"; }

    void PrintUsage() override;
    void PrintParameters() override;
    void PrintFooter() override;

    Result<void> GetConfigurationFromArgcArgv(int argc, const wchar_t* argv[]) override;
    Result<void> CheckConfiguration() override;

    Result<void> Run() override;

private:
    NetworkLocationResolver::Ptr CreateResolver() const;

    Result<void> RunList(const NetworkLocationResolver& resolver);
    Result<void> RunInfo(const NetworkLocationResolver& resolver);
    Result<void> RunLabel(const NetworkLocationResolver& resolver);

    void PrintLocations(const std::vector<NetworkLocation>& locations);
    void PrintDetails(const NetworkLocation& location);
    void PrintRecord(const NetworkLocation& location);

    Configuration config;
};

}  // namespace Command::NetworkLocations
}  // namespace Netloc

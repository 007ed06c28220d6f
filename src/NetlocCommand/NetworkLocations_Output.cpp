//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "NetworkLocations.h"

#include "Text/Fmt/NetworkLocation.h"

using namespace Netloc;
using namespace Netloc::Command::NetworkLocations;

namespace {

std::wstring_view ToString(Main::Action action)
{
    switch (action)
    {
        case Main::Action::List:
            return L"list";
        case Main::Action::Info:
            return L"info";
        case Main::Action::Label:
            return L"label";
    }

    return Netloc::Command::kNoneAvailableW;
}

std::wstring_view ToYesNo(bool value)
{
    return value ? L"Yes" : L"No";
}

}  // namespace

void Main::PrintUsage()
{
    // Display the tool's usage
    m_console.Print(
        L"\n"
        L"\tusage: Netloc [/list] [/info=<unc>] [/label=<unc> /rename=<label>] [/shortcuts=<dir>] [/record]\n"
        L"\n"
        L"\t/list                       : List the network locations of the shortcuts folder (default)\n"
        L"\t/info=<unc>                 : Print details about the location of '\\\\server\\share'\n"
        L"\t/label=<unc>                : Location whose shortcut label is renamed with /rename\n"
        L"\t/rename=<label>             : New label of the location selected with /label\n"
        L"\t/shortcuts=<dir>            : Network shortcuts folder (default: user 'Network Shortcuts')\n"
        L"\t/record                     : Print locations as 'key=value' records\n");

    PrintCommonUsage();
}

void Main::PrintParameters()
{
    // Parameters are displayed when the configuration is complete and checked

    m_errorConsole.Print(L"Parameters:");
    PrintCommonParameters();

    m_errorConsole.PrintValue(1, L"Action", ToString(config.action));
    m_errorConsole.PrintValue(
        1, L"Shortcuts folder", config.shortcuts ? config.shortcuts->wstring() : std::wstring(kNoneAvailableW));

    if (config.uncPath)
    {
        m_errorConsole.PrintValue(1, L"Location", *config.uncPath);
    }

    if (config.newLabel)
    {
        m_errorConsole.PrintValue(1, L"New label", *config.newLabel);
    }

    m_errorConsole.PrintValue(1, L"Record output", ToYesNo(config.record));
    m_errorConsole.PrintNewLine();
}

void Main::PrintFooter()
{
    m_errorConsole.PrintNewLine();
    m_errorConsole.Print(L"Statistics:");
    PrintCommonFooter();
}

void Main::PrintLocations(const std::vector<NetworkLocation>& locations)
{
    if (locations.empty())
    {
        m_console.Print(L"No network location found");
        return;
    }

    m_console.Print(L"{:<40} {:<6} {:<7} {}", L"Name", L"Ready", L"Mapped", L"Label");
    for (const auto& location : locations)
    {
        const auto label = location.ShareLabel();
        m_console.Print(
            L"{:<40} {:<6} {:<7} {}",
            location,
            ToYesNo(location.IsReady()),
            ToYesNo(location.IsMapped()),
            label ? *label : std::wstring(kErrorW));
    }
}

void Main::PrintDetails(const NetworkLocation& location)
{
    m_console.Print(L"{}", location);
    m_console.PrintValue(1, L"Server", location.ServerName());
    m_console.PrintValue(1, L"Share", location.ShareName());
    m_console.PrintValue(1, L"Ready", ToYesNo(location.IsReady()));
    m_console.PrintValue(1, L"Mapped", ToYesNo(location.IsMapped()));

    const auto label = location.ShareLabel();
    if (label)
    {
        m_console.PrintValue(1, L"Label", *label);
    }
    else
    {
        m_console.PrintValue(1, L"Label", fmt::format(L"{} [{}]", kNoneAvailableW, label.error()));
    }

    m_console.PrintValue(1, L"Shortcut", location.ShortcutPath().wstring());
    m_console.PrintValue(1, L"Root directory", location.RootDirectory().wstring());
}

void Main::PrintRecord(const NetworkLocation& location)
{
    // Records are separated with an empty line
    m_console.Write(L"{}", location.ToRecord().Serialize());
    m_console.PrintNewLine();
}

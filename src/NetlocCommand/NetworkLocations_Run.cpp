//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "NetworkLocations.h"

#include "FileSystem.h"
#include "FolderShortcutResolver.h"
#include "Text/Fmt/NetworkLocation.h"

#ifdef _WIN32
#    include "ComShellLinkResolver.h"
#endif

using namespace Netloc;
using namespace Netloc::Command::NetworkLocations;

NetworkLocationResolver::Ptr Main::CreateResolver() const
{
#ifdef _WIN32
    auto shellLinkResolver = std::make_shared<ComShellLinkResolver>();
#else
    auto shellLinkResolver = std::make_shared<FolderShortcutResolver>();
#endif

    return NetworkLocationResolver::Create(
        std::make_shared<FileSystem>(), std::move(shellLinkResolver), *config.shortcuts);
}

Result<void> Main::RunList(const NetworkLocationResolver& resolver)
{
    const auto locations = resolver.EnumerateAll();
    Log::Info(L"Found {} network location(s) in '{}'", locations.size(), resolver.ShortcutsContainer().wstring());

    if (config.record)
    {
        for (const auto& location : locations)
        {
            PrintRecord(location);
        }

        return Success();
    }

    PrintLocations(locations);
    return Success();
}

Result<void> Main::RunInfo(const NetworkLocationResolver& resolver)
{
    auto location = resolver.FromUncPath(*config.uncPath);
    if (!location)
    {
        Log::Error(L"Failed to parse UNC path: '{}' [{}]", *config.uncPath, location.error());
        return location.error();
    }

    if (config.record)
    {
        PrintRecord(*location);
        return Success();
    }

    PrintDetails(*location);
    return Success();
}

Result<void> Main::RunLabel(const NetworkLocationResolver& resolver)
{
    auto location = resolver.FromUncPath(*config.uncPath);
    if (!location)
    {
        Log::Error(L"Failed to parse UNC path: '{}' [{}]", *config.uncPath, location.error());
        return location.error();
    }

    const auto previous = location->ShareLabel();

    auto rv = location->SetShareLabel(*config.newLabel);
    if (!rv)
    {
        Log::Error(L"Failed to rename label of '{}' to '{}' [{}]", *location, *config.newLabel, rv.error());
        return rv.error();
    }

    m_console.Print(
        L"Renamed '{}' label from '{}' to '{}'",
        *location,
        previous ? *previous : std::wstring(kErrorW),
        *config.newLabel);

    return Success();
}

Result<void> Main::Run()
{
    const auto resolver = CreateResolver();

    switch (config.action)
    {
        case Action::List:
            return RunList(*resolver);
        case Action::Info:
            return RunInfo(*resolver);
        case Action::Label:
            return RunLabel(*resolver);
    }

    return std::make_error_code(std::errc::invalid_argument);
}

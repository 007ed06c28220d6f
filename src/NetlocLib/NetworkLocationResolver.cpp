//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "NetworkLocationResolver.h"

#include <fmt/xchar.h>

#include "CaseInsensitive.h"
#include "Log/Log.h"
#include "NetworkLocationError.h"

namespace fs = std::filesystem;

namespace Netloc {

namespace {

class NetworkLocationResolverImpl final : public NetworkLocationResolver
{
public:
    NetworkLocationResolverImpl(
        std::shared_ptr<IFileSystem> fileSystem,
        std::shared_ptr<IShellLinkResolver> shellLinkResolver,
        fs::path shortcutsContainer)
        : NetworkLocationResolver(std::move(fileSystem), std::move(shellLinkResolver), std::move(shortcutsContainer))
    {
    }
};

bool IsValidLabel(std::wstring_view label)
{
    if (IsBlank(label))
    {
        return false;
    }

    return label.find_first_of(L"\\/") == std::wstring_view::npos;
}

constexpr std::wstring_view kShellLinkExtension = L".lnk";

}  // namespace

NetworkLocationResolver::Ptr NetworkLocationResolver::Create(
    std::shared_ptr<IFileSystem> fileSystem,
    std::shared_ptr<IShellLinkResolver> shellLinkResolver,
    fs::path shortcutsContainer)
{
    return std::make_shared<NetworkLocationResolverImpl>(
        std::move(fileSystem), std::move(shellLinkResolver), std::move(shortcutsContainer));
}

NetworkLocationResolver::NetworkLocationResolver(
    std::shared_ptr<IFileSystem> fileSystem,
    std::shared_ptr<IShellLinkResolver> shellLinkResolver,
    fs::path shortcutsContainer)
    : m_fileSystem(std::move(fileSystem))
    , m_shellLinkResolver(std::move(shellLinkResolver))
    , m_container(std::move(shortcutsContainer))
{
}

Result<NetworkLocation> NetworkLocationResolver::FromUncPath(const wchar_t* uncPath) const
{
    auto unc = UncPath::Parse(uncPath);
    if (!unc)
    {
        return unc.error();
    }

    return NetworkLocation(shared_from_this(), *unc);
}

Result<NetworkLocation> NetworkLocationResolver::FromUncPath(std::wstring_view uncPath) const
{
    auto unc = UncPath::Parse(uncPath);
    if (!unc)
    {
        return unc.error();
    }

    return NetworkLocation(shared_from_this(), *unc);
}

Result<NetworkLocation> NetworkLocationResolver::FromRecord(const NetworkLocationRecord& record) const
{
    if (IsBlank(record.shareName) || IsBlank(record.serverName))
    {
        Log::Debug("Failed to rebuild network location from record: blank share or server name");
        return make_error_code(NetworkLocationErrc::InvalidInput);
    }

    auto rootPath = record.rootDirectory;
    if (IsBlank(rootPath))
    {
        rootPath = fmt::format(L"\\\\{}\\{}", record.serverName, record.shareName);
    }

    std::optional<fs::path> shortcut;
    if (!IsBlank(record.shortcutFile))
    {
        shortcut = fs::path(record.shortcutFile);
    }

    return NetworkLocation(
        shared_from_this(), record.serverName, record.shareName, std::move(rootPath), std::move(shortcut));
}

std::vector<NetworkLocation> NetworkLocationResolver::EnumerateAll() const
{
    std::vector<NetworkLocation> locations;

    auto opened = m_shellLinkResolver->Open(m_container);
    if (!opened)
    {
        Log::Debug(L"Network shortcuts container is not available '{}' [{}]", m_container.wstring(), opened.error());
        return locations;
    }

    auto entries = m_fileSystem->ListEntries(m_container);
    if (!entries)
    {
        Log::Debug(L"Failed to list network shortcuts '{}' [{}]", m_container.wstring(), entries.error());
        return locations;
    }

    locations.reserve(entries->size());
    for (const auto& entry : *entries)
    {
        const auto target = ResolveLinkTarget(entry);
        if (!target || IsBlank(*target))
        {
            Log::Debug(L"Skip network shortcut '{}': no link target", entry.wstring());
            continue;
        }

        auto unc = UncPath::Parse(*target);
        if (!unc)
        {
            Log::Debug(L"Skip network shortcut '{}': invalid target '{}' [{}]", entry.wstring(), *target, unc.error());
            continue;
        }

        locations.emplace_back(shared_from_this(), *unc, entry);
    }

    return locations;
}

bool NetworkLocationResolver::IsReachable(const NetworkLocation& location) const
{
    return m_fileSystem->IsDirectory(location.RootDirectory());
}

bool NetworkLocationResolver::IsShortcutPresent(const NetworkLocation& location) const
{
    return m_fileSystem->Exists(ResolveShortcutEntry(location));
}

Result<std::wstring> NetworkLocationResolver::GetLabel(const NetworkLocation& location) const
{
    const auto& entry = ResolveShortcutEntry(location);
    if (!m_fileSystem->Exists(entry))
    {
        Log::Debug(L"Cannot find the network location shortcut '{}'", entry.wstring());
        return make_error_code(NetworkLocationErrc::NotFound);
    }

    if (IsShellLinkFile(entry))
    {
        return entry.stem().wstring();
    }

    return entry.filename().wstring();
}

Result<void> NetworkLocationResolver::SetLabel(NetworkLocation& location, std::wstring_view label) const
{
    if (!IsValidLabel(label))
    {
        Log::Debug(L"Invalid network location label '{}'", label);
        return make_error_code(NetworkLocationErrc::InvalidInput);
    }

    const auto entry = ResolveShortcutEntry(location);
    if (!m_fileSystem->Exists(entry))
    {
        Log::Debug(L"Cannot find the network location shortcut '{}'", entry.wstring());
        return make_error_code(NetworkLocationErrc::NotFound);
    }

    auto newName = std::wstring(label);
    if (IsShellLinkFile(entry))
    {
        newName.append(kShellLinkExtension);
    }

    auto newPath = entry.parent_path() / fs::path(newName);
    auto renamed = m_fileSystem->Rename(entry, newPath);
    if (!renamed)
    {
        Log::Error(
            L"Failed to rename network location shortcut '{}' to '{}' [{}]",
            entry.wstring(),
            newPath.wstring(),
            renamed.error());
        return make_error_code(NetworkLocationErrc::IOFailure);
    }

    location.m_shortcut = std::move(newPath);
    return Success();
}

// Shortcut entries are folder shortcuts or '.lnk' files, the extension of the latter is not part of the label
bool NetworkLocationResolver::IsShellLinkFile(const fs::path& entry) const
{
    return equalCaseInsensitive(entry.extension().wstring(), kShellLinkExtension) && !m_fileSystem->IsDirectory(entry);
}

const fs::path& NetworkLocationResolver::ResolveShortcutEntry(const NetworkLocation& location) const
{
    if (!location.m_shortcut)
    {
        location.m_shortcut = FindShortcutEntry(location);
    }

    return *location.m_shortcut;
}

fs::path NetworkLocationResolver::PlaceholderEntry(std::wstring_view serverName, std::wstring_view shareName) const
{
    return m_container / fs::path(fmt::format(L"{} ({})", shareName, serverName));
}

fs::path NetworkLocationResolver::FindShortcutEntry(const NetworkLocation& location) const
{
    auto opened = m_shellLinkResolver->Open(m_container);
    if (!opened)
    {
        Log::Debug(L"Network shortcuts container is not available '{}' [{}]", m_container.wstring(), opened.error());
        return PlaceholderEntry(location.ServerName(), location.ShareName());
    }

    auto entries = m_fileSystem->ListEntries(m_container);
    if (!entries)
    {
        Log::Debug(L"Failed to list network shortcuts '{}' [{}]", m_container.wstring(), entries.error());
        return PlaceholderEntry(location.ServerName(), location.ShareName());
    }

    for (const auto& entry : *entries)
    {
        const auto target = ResolveLinkTarget(entry);
        if (target && equalCaseInsensitive(*target, location.Name()))
        {
            return entry;
        }
    }

    Log::Debug(L"No network shortcut targets '{}'", location.Name());
    return PlaceholderEntry(location.ServerName(), location.ShareName());
}

std::optional<std::wstring> NetworkLocationResolver::ResolveLinkTarget(const fs::path& entry) const
{
    auto target = m_shellLinkResolver->ResolveLinkTarget(m_container, entry.filename().wstring());
    if (!target)
    {
        Log::Debug(L"Failed to resolve network shortcut '{}' [{}]", entry.wstring(), target.error());
        return {};
    }

    return *target;
}

}  // namespace Netloc

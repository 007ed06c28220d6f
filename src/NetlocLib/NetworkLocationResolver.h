//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "IFileSystem.h"
#include "IShellLinkResolver.h"
#include "NetworkLocation.h"
#include "NetworkLocationRecord.h"
#include "Utils/Result.h"

namespace Netloc {

/*!
 * \brief Match network locations with the shortcut entries of a network shortcuts container.
 *
 * Locations keep a reference on the resolver which created them and forward their shortcut dependent queries to it.
 */
class NetworkLocationResolver : public std::enable_shared_from_this<NetworkLocationResolver>
{
public:
    using Ptr = std::shared_ptr<NetworkLocationResolver>;

    static Ptr Create(
        std::shared_ptr<IFileSystem> fileSystem,
        std::shared_ptr<IShellLinkResolver> shellLinkResolver,
        std::filesystem::path shortcutsContainer);

    const std::filesystem::path& ShortcutsContainer() const { return m_container; }

    Result<NetworkLocation> FromUncPath(const wchar_t* uncPath) const;
    Result<NetworkLocation> FromUncPath(std::wstring_view uncPath) const;

    // Rebuild a location with its shortcut entry already known
    Result<NetworkLocation> FromRecord(const NetworkLocationRecord& record) const;

    // Every shortcut entry resolving to a valid UNC path, entries which cannot be resolved are skipped
    std::vector<NetworkLocation> EnumerateAll() const;

    bool IsReachable(const NetworkLocation& location) const;
    bool IsShortcutPresent(const NetworkLocation& location) const;

    Result<std::wstring> GetLabel(const NetworkLocation& location) const;
    Result<void> SetLabel(NetworkLocation& location, std::wstring_view label) const;

    // Computed at most once per location then cached in it
    const std::filesystem::path& ResolveShortcutEntry(const NetworkLocation& location) const;

    // Entry guessed when no shortcut targets the location: '{shareName} ({serverName})'
    std::filesystem::path PlaceholderEntry(std::wstring_view serverName, std::wstring_view shareName) const;

protected:
    NetworkLocationResolver(
        std::shared_ptr<IFileSystem> fileSystem,
        std::shared_ptr<IShellLinkResolver> shellLinkResolver,
        std::filesystem::path shortcutsContainer);

private:
    std::filesystem::path FindShortcutEntry(const NetworkLocation& location) const;
    std::optional<std::wstring> ResolveLinkTarget(const std::filesystem::path& entry) const;
    bool IsShellLinkFile(const std::filesystem::path& entry) const;

    std::shared_ptr<IFileSystem> m_fileSystem;
    std::shared_ptr<IShellLinkResolver> m_shellLinkResolver;
    std::filesystem::path m_container;
};

}  // namespace Netloc

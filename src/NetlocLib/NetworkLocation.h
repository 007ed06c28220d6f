//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "NetworkLocationRecord.h"
#include "UncPath.h"
#include "Utils/Result.h"

namespace Netloc {

class NetworkLocationResolver;

/*!
 * \brief Network location identified by its '\\server\share' root path.
 *
 * The shortcut entry of the location is searched lazily by the resolver which created it and cached for the
 * location lifetime. Other properties are queried from the live file system on each call.
 */
class NetworkLocation
{
public:
    NetworkLocation(
        std::shared_ptr<const NetworkLocationResolver> resolver,
        std::wstring serverName,
        std::wstring shareName,
        std::wstring rootPath,
        std::optional<std::filesystem::path> shortcut = {});

    NetworkLocation(
        std::shared_ptr<const NetworkLocationResolver> resolver,
        const UncPath& uncPath,
        std::optional<std::filesystem::path> shortcut = {});

    // The root directory currently exists
    bool IsReady() const;

    // The shortcut entry currently exists
    bool IsMapped() const;

    // Root path like '\\192.168.100.1\data'
    const std::wstring& Name() const { return m_rootPath; }

    const std::wstring& ShareName() const { return m_shareName; }
    const std::wstring& ServerName() const { return m_serverName; }

    Result<std::wstring> ShareLabel() const;
    Result<void> SetShareLabel(std::wstring_view label);

    const std::filesystem::path& ShortcutPath() const;
    std::filesystem::path RootDirectory() const { return std::filesystem::path(m_rootPath); }

    NetworkLocationRecord ToRecord() const;

    std::wstring ToString() const { return m_rootPath; }

    bool operator==(const NetworkLocation& other) const;
    bool operator!=(const NetworkLocation& other) const { return !(*this == other); }

private:
    friend class NetworkLocationResolver;

    std::shared_ptr<const NetworkLocationResolver> m_resolver;
    std::wstring m_serverName;
    std::wstring m_shareName;
    std::wstring m_rootPath;
    mutable std::optional<std::filesystem::path> m_shortcut;
};

struct NetworkLocationHash
{
    size_t operator()(const NetworkLocation& location) const;
};

}  // namespace Netloc

namespace std {

template <>
struct hash<Netloc::NetworkLocation>
{
    size_t operator()(const Netloc::NetworkLocation& location) const { return Netloc::NetworkLocationHash()(location); }
};

}  // namespace std

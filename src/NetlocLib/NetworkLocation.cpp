//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "NetworkLocation.h"

#include "CaseInsensitive.h"
#include "NetworkLocationResolver.h"

namespace Netloc {

NetworkLocation::NetworkLocation(
    std::shared_ptr<const NetworkLocationResolver> resolver,
    std::wstring serverName,
    std::wstring shareName,
    std::wstring rootPath,
    std::optional<std::filesystem::path> shortcut)
    : m_resolver(std::move(resolver))
    , m_serverName(std::move(serverName))
    , m_shareName(std::move(shareName))
    , m_rootPath(std::move(rootPath))
    , m_shortcut(std::move(shortcut))
{
}

NetworkLocation::NetworkLocation(
    std::shared_ptr<const NetworkLocationResolver> resolver,
    const UncPath& uncPath,
    std::optional<std::filesystem::path> shortcut)
    : NetworkLocation(
        std::move(resolver),
        uncPath.ServerName(),
        uncPath.ShareName(),
        uncPath.RootPath(),
        std::move(shortcut))
{
}

bool NetworkLocation::IsReady() const
{
    return m_resolver->IsReachable(*this);
}

bool NetworkLocation::IsMapped() const
{
    return m_resolver->IsShortcutPresent(*this);
}

Result<std::wstring> NetworkLocation::ShareLabel() const
{
    return m_resolver->GetLabel(*this);
}

Result<void> NetworkLocation::SetShareLabel(std::wstring_view label)
{
    return m_resolver->SetLabel(*this, label);
}

const std::filesystem::path& NetworkLocation::ShortcutPath() const
{
    return m_resolver->ResolveShortcutEntry(*this);
}

NetworkLocationRecord NetworkLocation::ToRecord() const
{
    return {m_shareName, m_serverName, m_rootPath, ShortcutPath().wstring()};
}

bool NetworkLocation::operator==(const NetworkLocation& other) const
{
    return equalCaseInsensitive(m_rootPath, other.m_rootPath);
}

size_t NetworkLocationHash::operator()(const NetworkLocation& location) const
{
    return hashCaseInsensitive(location.Name());
}

}  // namespace Netloc

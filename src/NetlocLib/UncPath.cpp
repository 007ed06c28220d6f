//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "UncPath.h"

#include <cwctype>

#include <fmt/xchar.h>

#include "NetworkLocationError.h"

namespace Netloc {

bool IsBlank(std::wstring_view text)
{
    for (const auto c : text)
    {
        if (!std::iswspace(c))
        {
            return false;
        }
    }

    return true;
}

UncPath::UncPath(std::wstring serverName, std::wstring shareName)
    : m_serverName(std::move(serverName))
    , m_shareName(std::move(shareName))
{
}

Result<UncPath> UncPath::Parse(const wchar_t* path)
{
    if (path == nullptr)
    {
        return make_error_code(NetworkLocationErrc::InvalidInput);
    }

    return Parse(std::wstring_view(path));
}

Result<UncPath> UncPath::Parse(std::wstring_view path)
{
    if (IsBlank(path))
    {
        return make_error_code(NetworkLocationErrc::InvalidInput);
    }

    if (path.size() < 2 || path[0] != kSeparator || path[1] != kSeparator)
    {
        return make_error_code(NetworkLocationErrc::MalformedUnc);
    }

    // Leading separators are stripped greedily so '\\\share' has no server
    const auto rootPos = path.find_first_not_of(kSeparator);
    if (rootPos == std::wstring_view::npos)
    {
        return make_error_code(NetworkLocationErrc::MalformedUnc);
    }

    const auto root = path.substr(rootPos);

    const auto serverEnd = root.find(kSeparator);
    if (serverEnd == std::wstring_view::npos || serverEnd == 0)
    {
        return make_error_code(NetworkLocationErrc::MalformedUnc);
    }

    auto serverName = root.substr(0, serverEnd);
    auto share = root.substr(serverEnd + 1);

    const auto shareEnd = share.find(kSeparator);
    if (shareEnd != std::wstring_view::npos)
    {
        share = share.substr(0, shareEnd);
    }

    if (IsBlank(share))
    {
        return make_error_code(NetworkLocationErrc::MalformedUnc);
    }

    return UncPath(std::wstring(serverName), std::wstring(share));
}

std::wstring UncPath::RootPath() const
{
    return fmt::format(L"{0}{0}{1}{0}{2}", kSeparator, m_serverName, m_shareName);
}

}  // namespace Netloc

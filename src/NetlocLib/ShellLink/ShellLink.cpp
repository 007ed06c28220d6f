//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "ShellLink/ShellLink.h"

#include <fstream>
#include <iterator>
#include <vector>

#include "Log/Log.h"

namespace Netloc {
namespace ShellLink {

namespace {

// Upper bound of a loadable shell link file
constexpr uintmax_t kMaxShellLinkSize = 1024 * 1024;

}  // namespace

void ShellLink::Parse(BufferView buffer, ShellLink& shellLink, std::error_code& ec)
{
    ShellLinkHeader::Parse(buffer, shellLink.m_header, ec);
    if (ec)
    {
        return;
    }

    auto offset = sizeof(ShellLinkHeader::Layout);

    if (shellLink.m_header.HasLinkTargetIdList())
    {
        const auto view = MakeSubView(buffer, offset, ec);
        if (ec)
        {
            Log::Debug("Shell link is corrupted: invalid id list offset [{}]", ec);
            return;
        }

        IdList idList;
        IdList::Parse(view, idList, ec);
        if (ec)
        {
            return;
        }

        offset += idList.Size();
        shellLink.m_idList = std::move(idList);
    }

    if (shellLink.m_header.HasLinkInfo())
    {
        const auto view = MakeSubView(buffer, offset, ec);
        if (ec)
        {
            Log::Debug("Shell link is corrupted: invalid link info offset [{}]", ec);
            return;
        }

        LinkInfo linkInfo;
        LinkInfo::Parse(view, linkInfo, ec);
        if (ec)
        {
            return;
        }

        shellLink.m_linkInfo = std::move(linkInfo);
    }
}

Result<ShellLink> ShellLink::Load(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        Log::Debug(L"Failed to get shell link size '{}' [{}]", path.wstring(), ec);
        return ec;
    }

    if (size > kMaxShellLinkSize)
    {
        Log::Debug(L"Failed to load shell link '{}': file is too big ({})", path.wstring(), size);
        return std::make_error_code(std::errc::file_too_large);
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file)
    {
        Log::Debug(L"Failed to open shell link '{}'", path.wstring());
        return std::make_error_code(std::errc::io_error);
    }

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
    if (!file)
    {
        Log::Debug(L"Failed to read shell link '{}'", path.wstring());
        return std::make_error_code(std::errc::io_error);
    }

    ShellLink shellLink;
    Parse(ToBufferView(buffer), shellLink, ec);
    if (ec)
    {
        Log::Debug(L"Failed to parse shell link '{}' [{}]", path.wstring(), ec);
        return ec;
    }

    return shellLink;
}

std::optional<std::wstring> ShellLink::Target() const
{
    if (m_linkInfo)
    {
        auto target = m_linkInfo->Target();
        if (target)
        {
            return target;
        }
    }

    if (m_idList)
    {
        return m_idList->NetworkLocation();
    }

    return {};
}

}  // namespace ShellLink
}  // namespace Netloc

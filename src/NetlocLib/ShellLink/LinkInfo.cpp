//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "ShellLink/LinkInfo.h"

#include "Log/Log.h"
#include "ShellLink/String.h"

namespace Netloc {
namespace ShellLink {

void LinkInfo::Parse(BufferView buffer, LinkInfo& linkInfo, std::error_code& ec)
{
    if (buffer.size() < sizeof(LinkInfo::Layout))
    {
        Log::Debug("Failed to parse shell link info: invalid size");
        ec = std::make_error_code(std::errc::message_size);
        return;
    }

    auto& layout = *reinterpret_cast<const LinkInfo::Layout*>(buffer.data());

    const auto size = *reinterpret_cast<const uint32_t*>(&layout.linkInfoSize);
    const auto headerSize = *reinterpret_cast<const uint32_t*>(&layout.linkInfoHeaderSize);
    if (size > buffer.size() || headerSize < sizeof(LinkInfo::Layout) || headerSize > size)
    {
        Log::Debug("Shell link info is corrupted: invalid size (size: {:#x}, header: {:#x})", size, headerSize);
        ec = std::make_error_code(std::errc::bad_message);
        return;
    }

    buffer = BufferView(buffer.data(), size);
    linkInfo.m_size = size;

    const auto flags = *reinterpret_cast<const uint32_t*>(&layout.linkInfoFlags);
    const bool hasUnicode = headerSize >= kUnicodeHeaderSize;
    if (hasUnicode && buffer.size() < sizeof(LinkInfo::UnicodeLayout))
    {
        Log::Debug("Shell link info is corrupted: invalid unicode header size");
        ec = std::make_error_code(std::errc::bad_message);
        return;
    }

    const auto& unicodeLayout = *reinterpret_cast<const LinkInfo::UnicodeLayout*>(buffer.data());

    if (flags & kVolumeIdAndLocalBasePath)
    {
        if (hasUnicode)
        {
            const auto offset = *reinterpret_cast<const uint32_t*>(&unicodeLayout.localBasePathOffsetUnicode);
            linkInfo.m_localBasePath = ReadUnicodeString(buffer, offset, ec);
        }
        else
        {
            const auto offset = *reinterpret_cast<const uint32_t*>(&layout.localBasePathOffset);
            linkInfo.m_localBasePath = ReadAnsiString(buffer, offset, ec);
        }

        if (ec)
        {
            Log::Debug("Shell link info is corrupted: invalid local base path [{}]", ec);
            return;
        }
    }

    if (flags & kCommonNetworkRelativeLinkAndPathSuffix)
    {
        const auto offset = *reinterpret_cast<const uint32_t*>(&layout.commonNetworkRelativeLinkOffset);
        const auto view = MakeSubView(buffer, offset, ec);
        if (ec)
        {
            Log::Debug("Shell link info is corrupted: invalid 'commonNetworkRelativeLinkOffset' [{}]", ec);
            return;
        }

        ParseCommonNetworkRelativeLink(view, linkInfo, ec);
        if (ec)
        {
            return;
        }
    }

    const auto suffixOffset = hasUnicode
        ? *reinterpret_cast<const uint32_t*>(&unicodeLayout.commonPathSuffixOffsetUnicode)
        : *reinterpret_cast<const uint32_t*>(&layout.commonPathSuffixOffset);
    if (suffixOffset == 0)
    {
        return;
    }

    linkInfo.m_commonPathSuffix =
        hasUnicode ? ReadUnicodeString(buffer, suffixOffset, ec) : ReadAnsiString(buffer, suffixOffset, ec);
    if (ec)
    {
        Log::Debug("Shell link info is corrupted: invalid common path suffix [{}]", ec);
        return;
    }
}

void LinkInfo::ParseCommonNetworkRelativeLink(BufferView buffer, LinkInfo& linkInfo, std::error_code& ec)
{
    if (buffer.size() < sizeof(LinkInfo::CommonNetworkRelativeLinkLayout))
    {
        Log::Debug("Failed to parse common network relative link: invalid size");
        ec = std::make_error_code(std::errc::message_size);
        return;
    }

    auto& layout = *reinterpret_cast<const LinkInfo::CommonNetworkRelativeLinkLayout*>(buffer.data());

    const auto size = *reinterpret_cast<const uint32_t*>(&layout.size);
    if (size < sizeof(LinkInfo::CommonNetworkRelativeLinkLayout) || size > buffer.size())
    {
        Log::Debug("Common network relative link is corrupted: invalid size ({:#x})", size);
        ec = std::make_error_code(std::errc::bad_message);
        return;
    }

    buffer = BufferView(buffer.data(), size);

    const auto netNameOffset = *reinterpret_cast<const uint32_t*>(&layout.netNameOffset);
    if (netNameOffset > sizeof(LinkInfo::CommonNetworkRelativeLinkLayout)
        && size >= sizeof(LinkInfo::CommonNetworkRelativeLinkUnicodeLayout))
    {
        auto& unicodeLayout = *reinterpret_cast<const LinkInfo::CommonNetworkRelativeLinkUnicodeLayout*>(buffer.data());
        const auto offset = *reinterpret_cast<const uint32_t*>(&unicodeLayout.netNameOffsetUnicode);
        linkInfo.m_netName = ReadUnicodeString(buffer, offset, ec);
    }
    else
    {
        linkInfo.m_netName = ReadAnsiString(buffer, netNameOffset, ec);
    }

    if (ec)
    {
        Log::Debug("Common network relative link is corrupted: invalid net name [{}]", ec);
        return;
    }
}

std::optional<std::wstring> LinkInfo::Target() const
{
    if (m_netName && !m_netName->empty())
    {
        if (m_commonPathSuffix.empty())
        {
            return m_netName;
        }

        return *m_netName + L'\\' + m_commonPathSuffix;
    }

    if (m_localBasePath && !m_localBasePath->empty())
    {
        return *m_localBasePath + m_commonPathSuffix;
    }

    return {};
}

}  // namespace ShellLink
}  // namespace Netloc

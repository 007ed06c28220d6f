//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include "Utils/BufferView.h"

namespace Netloc {
namespace ShellLink {

//
// LinkInfo structure of a shell link, it locates the link target on a local volume or on a network share
//

class LinkInfo final
{
public:
    enum Flags : uint32_t
    {
        kVolumeIdAndLocalBasePath = 0x00000001,
        kCommonNetworkRelativeLinkAndPathSuffix = 0x00000002
    };

#pragma pack(push, 1)
    struct Layout
    {
        uint8_t linkInfoSize[4];
        uint8_t linkInfoHeaderSize[4];
        uint8_t linkInfoFlags[4];
        uint8_t volumeIdOffset[4];
        uint8_t localBasePathOffset[4];
        uint8_t commonNetworkRelativeLinkOffset[4];
        uint8_t commonPathSuffixOffset[4];
    };

    // Present when 'linkInfoHeaderSize' is at least 0x24
    struct UnicodeLayout
    {
        Layout base;
        uint8_t localBasePathOffsetUnicode[4];
        uint8_t commonPathSuffixOffsetUnicode[4];
    };

    struct CommonNetworkRelativeLinkLayout
    {
        uint8_t size[4];
        uint8_t flags[4];
        uint8_t netNameOffset[4];
        uint8_t deviceNameOffset[4];
        uint8_t networkProviderType[4];
    };

    // Present when 'netNameOffset' is greater than 0x14
    struct CommonNetworkRelativeLinkUnicodeLayout
    {
        CommonNetworkRelativeLinkLayout base;
        uint8_t netNameOffsetUnicode[4];
        uint8_t deviceNameOffsetUnicode[4];
    };
#pragma pack(pop)

    static constexpr uint32_t kUnicodeHeaderSize = 0x24;

    // 'buffer' starts at the LinkInfo structure, its size is updated with 'linkInfoSize'
    static void Parse(BufferView buffer, LinkInfo& linkInfo, std::error_code& ec);

    uint32_t Size() const { return m_size; }

    const std::optional<std::wstring>& LocalBasePath() const { return m_localBasePath; }
    const std::optional<std::wstring>& NetName() const { return m_netName; }
    const std::wstring& CommonPathSuffix() const { return m_commonPathSuffix; }

    // Network path is preferred over local path like shell's SLGP_UNCPRIORITY
    std::optional<std::wstring> Target() const;

private:
    static void ParseCommonNetworkRelativeLink(BufferView buffer, LinkInfo& linkInfo, std::error_code& ec);

    uint32_t m_size = 0;
    std::optional<std::wstring> m_localBasePath;
    std::optional<std::wstring> m_netName;
    std::wstring m_commonPathSuffix;
};

}  // namespace ShellLink
}  // namespace Netloc

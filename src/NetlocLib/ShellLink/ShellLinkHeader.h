//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <system_error>

#include "Utils/BufferView.h"

namespace Netloc {
namespace ShellLink {

class ShellLinkHeader final
{
public:
    enum LinkFlags : uint32_t
    {
        kHasLinkTargetIdList = 0x00000001,
        kHasLinkInfo = 0x00000002,
        kHasName = 0x00000004,
        kHasRelativePath = 0x00000008,
        kHasWorkingDir = 0x00000010,
        kHasArguments = 0x00000020,
        kHasIconLocation = 0x00000040,
        kIsUnicode = 0x00000080,
        kForceNoLinkInfo = 0x00000100
    };

#pragma pack(push, 1)
    struct Layout
    {
        uint8_t headerSize[4];
        uint8_t linkClsid[16];
        uint8_t linkFlags[4];
        uint8_t fileAttributes[4];
        uint8_t creationTime[8];
        uint8_t accessTime[8];
        uint8_t writeTime[8];
        uint8_t fileSize[4];
        uint8_t iconIndex[4];
        uint8_t showCommand[4];
        uint8_t hotKey[2];
        uint8_t reserved1[2];
        uint8_t reserved2[4];
        uint8_t reserved3[4];
    };
#pragma pack(pop)

    static_assert(sizeof(Layout) == 0x4C);

    // {00021401-0000-0000-C000-000000000046} as stored on disk
    static const std::array<uint8_t, 16> kLinkClsid;

    static void Parse(BufferView buffer, ShellLinkHeader& header, std::error_code& ec);

    uint32_t Flags() const { return m_flags; }
    bool HasLinkTargetIdList() const { return m_flags & kHasLinkTargetIdList; }
    bool HasLinkInfo() const { return (m_flags & kHasLinkInfo) && !(m_flags & kForceNoLinkInfo); }

private:
    uint32_t m_flags = 0;
};

}  // namespace ShellLink
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "ShellLink/ShellLinkHeader.h"

#include <algorithm>

#include "Log/Log.h"

namespace Netloc {
namespace ShellLink {

const std::array<uint8_t, 16> ShellLinkHeader::kLinkClsid = {
    0x01, 0x14, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46};

void ShellLinkHeader::Parse(BufferView buffer, ShellLinkHeader& header, std::error_code& ec)
{
    if (buffer.size() < sizeof(ShellLinkHeader::Layout))
    {
        Log::Debug("Failed to parse shell link header: invalid size");
        ec = std::make_error_code(std::errc::message_size);
        return;
    }

    auto& layout = *reinterpret_cast<const ShellLinkHeader::Layout*>(buffer.data());

    const auto headerSize = *reinterpret_cast<const uint32_t*>(&layout.headerSize);
    if (headerSize != sizeof(ShellLinkHeader::Layout))
    {
        Log::Debug("Shell link header is corrupted: invalid 'headerSize' ({:#x})", headerSize);
        ec = std::make_error_code(std::errc::bad_message);
        return;
    }

    if (!std::equal(std::cbegin(kLinkClsid), std::cend(kLinkClsid), std::cbegin(layout.linkClsid)))
    {
        Log::Debug("Shell link header is corrupted: invalid 'linkClsid'");
        ec = std::make_error_code(std::errc::bad_message);
        return;
    }

    header.m_flags = *reinterpret_cast<const uint32_t*>(&layout.linkFlags);
}

}  // namespace ShellLink
}  // namespace Netloc

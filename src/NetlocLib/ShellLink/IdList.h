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
#include <vector>

#include "Utils/BufferView.h"

namespace Netloc {
namespace ShellLink {

//
// LinkTargetIDList of a shell link, only network location items are decoded
//

class IdList final
{
public:
    struct Item
    {
        uint8_t classType;
        std::optional<std::wstring> networkLocation;
    };

#pragma pack(push, 1)
    struct ItemLayout
    {
        uint8_t size[2];
        uint8_t classType;
    };

    struct NetworkItemLayout
    {
        uint8_t size[2];
        uint8_t classType;
        uint8_t flags;
    };
#pragma pack(pop)

    static constexpr uint8_t kClassTypeMask = 0x70;
    static constexpr uint8_t kNetworkLocationClassType = 0x40;

    // 'buffer' starts at the 'IDListSize' field, 'Size()' is the whole structure size including this field
    static void Parse(BufferView buffer, IdList& idList, std::error_code& ec);

    uint32_t Size() const { return m_size; }
    const std::vector<Item>& Items() const { return m_items; }

    // Location of the last network item, like '\\server\share'
    std::optional<std::wstring> NetworkLocation() const;

private:
    static void ParseItem(BufferView buffer, Item& item, std::error_code& ec);

    uint32_t m_size = 0;
    std::vector<Item> m_items;
};

}  // namespace ShellLink
}  // namespace Netloc

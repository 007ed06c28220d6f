//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "ShellLink/IdList.h"

#include "Log/Log.h"
#include "ShellLink/String.h"

namespace Netloc {
namespace ShellLink {

void IdList::Parse(BufferView buffer, IdList& idList, std::error_code& ec)
{
    if (buffer.size() < sizeof(uint16_t))
    {
        Log::Debug("Failed to parse shell link id list: invalid size");
        ec = std::make_error_code(std::errc::message_size);
        return;
    }

    const auto listSize = *reinterpret_cast<const uint16_t*>(buffer.data());
    if (buffer.size() - sizeof(uint16_t) < listSize)
    {
        Log::Debug("Shell link id list is corrupted: invalid 'IDListSize' ({:#x})", listSize);
        ec = std::make_error_code(std::errc::bad_message);
        return;
    }

    idList.m_size = sizeof(uint16_t) + listSize;

    auto items = BufferView(buffer.data() + sizeof(uint16_t), listSize);
    while (items.size() >= sizeof(uint16_t))
    {
        const auto itemSize = *reinterpret_cast<const uint16_t*>(items.data());
        if (itemSize == 0)
        {
            // TerminalID
            return;
        }

        if (itemSize < sizeof(ItemLayout) || itemSize > items.size())
        {
            Log::Debug("Shell link id list is corrupted: invalid item size ({:#x})", itemSize);
            ec = std::make_error_code(std::errc::bad_message);
            return;
        }

        Item item;
        ParseItem(BufferView(items.data(), itemSize), item, ec);
        if (ec)
        {
            return;
        }

        idList.m_items.push_back(std::move(item));
        items = items.subspan(itemSize);
    }

    Log::Debug("Shell link id list is corrupted: missing terminal id");
    ec = std::make_error_code(std::errc::bad_message);
}

void IdList::ParseItem(BufferView buffer, Item& item, std::error_code& ec)
{
    auto& layout = *reinterpret_cast<const IdList::ItemLayout*>(buffer.data());
    item.classType = layout.classType;

    if ((item.classType & kClassTypeMask) != kNetworkLocationClassType)
    {
        return;
    }

    if (buffer.size() < sizeof(NetworkItemLayout))
    {
        Log::Debug("Shell link network item is corrupted: invalid size");
        ec = std::make_error_code(std::errc::bad_message);
        return;
    }

    item.networkLocation = ReadAnsiString(buffer, sizeof(NetworkItemLayout), ec);
    if (ec)
    {
        Log::Debug("Shell link network item is corrupted: invalid location [{}]", ec);
        return;
    }
}

std::optional<std::wstring> IdList::NetworkLocation() const
{
    for (auto it = std::crbegin(m_items); it != std::crend(m_items); ++it)
    {
        if (it->networkLocation && !it->networkLocation->empty())
        {
            return it->networkLocation;
        }
    }

    return {};
}

}  // namespace ShellLink
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "ShellLink/String.h"

#include <algorithm>

#include "Text/Iconv.h"

namespace Netloc {
namespace ShellLink {

std::wstring ReadAnsiString(BufferView buffer, uint64_t offset, std::error_code& ec)
{
    const auto view = MakeSubView(buffer, offset, ec);
    if (ec)
    {
        return {};
    }

    const auto end = std::find(std::cbegin(view), std::cend(view), 0);
    if (end == std::cend(view))
    {
        ec = std::make_error_code(std::errc::bad_message);
        return {};
    }

    return AnsiToUtf16(std::string_view(reinterpret_cast<const char*>(view.data()), end - std::cbegin(view)));
}

std::wstring ReadUnicodeString(BufferView buffer, uint64_t offset, std::error_code& ec)
{
    const auto view = MakeSubView(buffer, offset, ec);
    if (ec)
    {
        return {};
    }

    std::u16string utf16;
    for (size_t i = 0; i + 1 < view.size(); i += 2)
    {
        const auto c = static_cast<char16_t>(view[i] | (view[i + 1] << 8));
        if (c == 0)
        {
            return FromUtf16(utf16);
        }

        utf16.push_back(c);
    }

    ec = std::make_error_code(std::errc::bad_message);
    return {};
}

}  // namespace ShellLink
}  // namespace Netloc

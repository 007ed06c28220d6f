//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <fmt/format.h>
#include <fmt/xchar.h>

#include "NetworkLocation.h"
#include "Text/Iconv.h"

template <>
struct fmt::formatter<Netloc::NetworkLocation> : public fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const Netloc::NetworkLocation& location, FormatContext& ctx) const -> decltype(ctx.out())
    {
        std::error_code ec;
        const auto utf8 = Netloc::Utf16ToUtf8(location.Name(), ec);
        if (ec)
        {
            return formatter<std::string_view>::format(Netloc::kFailedConversion, ctx);
        }

        return formatter<std::string_view>::format(utf8, ctx);
    }
};

template <>
struct fmt::formatter<Netloc::NetworkLocation, wchar_t> : public fmt::formatter<std::wstring_view, wchar_t>
{
    template <typename FormatContext>
    auto format(const Netloc::NetworkLocation& location, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return formatter<std::wstring_view, wchar_t>::format(location.Name(), ctx);
    }
};

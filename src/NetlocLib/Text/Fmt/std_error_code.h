//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2020 ANSSI. All Rights Reserved.
//
// Author(s): fabienfl (ANSSI)
//

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <fmt/xchar.h>

#include "Text/Iconv.h"

namespace Netloc {
namespace Fmt {

// 'HRESULT: message' for system errors, 'value: message' for other categories
inline std::string ErrorCodeToString(const std::error_code& ec)
{
    auto description = ec.category() == std::system_category()
        ? fmt::format("{:#x}", static_cast<uint32_t>(ec.value()))
        : fmt::format("{}", ec.value());

    auto message = ec.message();
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
    {
        message.pop_back();
    }

    if (!message.empty())
    {
        description.append(": ").append(message);
    }

    return description;
}

}  // namespace Fmt
}  // namespace Netloc

template <>
struct fmt::formatter<std::error_code> : public fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const std::error_code& ec, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return formatter<std::string_view>::format(Netloc::Fmt::ErrorCodeToString(ec), ctx);
    }
};

template <>
struct fmt::formatter<std::error_code, wchar_t> : public fmt::formatter<std::wstring_view, wchar_t>
{
    template <typename FormatContext>
    auto format(const std::error_code& ec, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return formatter<std::wstring_view, wchar_t>::format(Netloc::Utf8ToUtf16(Netloc::Fmt::ErrorCodeToString(ec)), ctx);
    }
};

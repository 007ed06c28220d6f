//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2020 ANSSI. All Rights Reserved.
//
// Author(s): fabienfl
//

#include "Text/Iconv.h"

#include <boost/nowide/convert.hpp>
#include <boost/nowide/utf/convert.hpp>

namespace Netloc {

//
// boost::nowide replaces invalid sequences with U+FFFD, a replacement means the input was not valid
//

std::string Utf16ToUtf8(std::wstring_view utf16, std::error_code& ec)
{
    if (utf16.size() == 0)
    {
        return {};
    }

    auto utf8 = boost::nowide::narrow(utf16.data(), utf16.size());
    if (utf16.find(L'\xFFFD') == std::wstring_view::npos && utf8.find("\xEF\xBF\xBD") != std::string::npos)
    {
        ec = std::make_error_code(std::errc::illegal_byte_sequence);
    }

    return utf8;
}

std::wstring Utf8ToUtf16(std::string_view utf8, std::error_code& ec)
{
    if (utf8.size() == 0)
    {
        return {};
    }

    auto utf16 = boost::nowide::widen(utf8.data(), utf8.size());
    if (utf8.find("\xEF\xBF\xBD") == std::string_view::npos && utf16.find(L'\xFFFD') != std::wstring::npos)
    {
        ec = std::make_error_code(std::errc::illegal_byte_sequence);
    }

    return utf16;
}

std::string Utf16ToUtf8(std::wstring_view utf16)
{
    std::error_code ec;
    auto utf8 = Utf16ToUtf8(utf16, ec);
    if (ec)
    {
        return std::string(kFailedConversion);
    }

    return utf8;
}

std::wstring Utf8ToUtf16(std::string_view utf8)
{
    std::error_code ec;
    auto utf16 = Utf8ToUtf16(utf8, ec);
    if (ec)
    {
        return std::wstring(kFailedConversionW);
    }

    return utf16;
}

std::wstring FromUtf16(std::u16string_view utf16)
{
    return boost::nowide::utf::convert_string<wchar_t>(utf16.data(), utf16.data() + utf16.size());
}

std::wstring AnsiToUtf16(std::string_view ansi)
{
    std::wstring utf16;
    utf16.reserve(ansi.size());
    for (const auto c : ansi)
    {
        utf16.push_back(static_cast<wchar_t>(static_cast<unsigned char>(c)));
    }

    return utf16;
}

}  // namespace Netloc

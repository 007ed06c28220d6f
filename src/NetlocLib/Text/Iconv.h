//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2020 ANSSI. All Rights Reserved.
//
// Author(s): fabienfl
//
#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace Netloc {

constexpr auto kFailedConversion = std::string_view("<encoding_error>");
constexpr auto kFailedConversionW = std::wstring_view(L"<encoding_error>");

std::string Utf16ToUtf8(std::wstring_view utf16, std::error_code& ec);
std::wstring Utf8ToUtf16(std::string_view utf8, std::error_code& ec);

std::wstring Utf8ToUtf16(std::string_view utf8);
std::string Utf16ToUtf8(std::wstring_view utf16);

// Platform wide string from raw UTF-16 code units, as found in on-disk structures
std::wstring FromUtf16(std::u16string_view utf16);

// Latin-1 like widening of byte strings read from legacy ansi structures
std::wstring AnsiToUtf16(std::string_view ansi);

}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2020 ANSSI. All Rights Reserved.
//
// Author(s): fabienfl
//

#pragma once

#include <cstdio>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/xchar.h>

#include "Text/Iconv.h"

namespace Netloc {
namespace Command {

constexpr auto kNoneAvailableW = std::wstring_view(L"N/A");
constexpr auto kErrorW = std::wstring_view(L"<Error>");

//
// Console formats wide text into a buffer which is written as utf-8 on each new line
//

class Console
{
public:
    using value_type = wchar_t;

    explicit Console(std::FILE* stream = stdout)
        : m_stream(stream)
    {
    }

    ~Console() { Flush(); }

    // Print to stdout with the given fmt parameters followed by 'newline' character
    template <typename... FmtArgs>
    void Print(fmt::wstring_view format, FmtArgs&&... args)
    {
        Write(format, std::forward<FmtArgs>(args)...);
        PrintNewLine();
    }

    // Print to stdout with the given fmt parameters followed by 'newline' character
    template <typename... FmtArgs>
    void Print(int indentationLevel, fmt::wstring_view format, FmtArgs&&... args)
    {
        const std::wstring indentation(indentationLevel * kIndentation, L' ');
        m_buffer.append(indentation.data(), indentation.data() + indentation.size());
        Print(format, std::forward<FmtArgs>(args)...);
    }

    // Print 'key: value' with values aligned on the same column
    template <typename V>
    void PrintValue(int indentationLevel, std::wstring_view key, const V& value)
    {
        Print(indentationLevel, L"{:<34}{}", fmt::format(L"{}:", key), value);
    }

    // Write into the console's buffer the given fmt parameters without 'newline' character
    template <typename... FmtArgs>
    void Write(fmt::wstring_view format, FmtArgs&&... args)
    {
        fmt::vformat_to(std::back_inserter(m_buffer), format, fmt::make_wformat_args(args...));
    }

    // Print to stdout the 'newline' character
    void PrintNewLine()
    {
        m_buffer.push_back(L'\n');
        Flush();
    }

    void Flush()
    {
        if (m_buffer.size() == 0)
        {
            return;
        }

        const auto utf8 = Utf16ToUtf8(std::wstring_view(m_buffer.data(), m_buffer.size()));
        std::fwrite(utf8.data(), 1, utf8.size(), m_stream);
        std::fflush(m_stream);
        m_buffer.clear();
    }

private:
    static constexpr size_t kIndentation = 2;

    std::FILE* m_stream;
    fmt::wmemory_buffer m_buffer;
};

}  // namespace Command
}  // namespace Netloc

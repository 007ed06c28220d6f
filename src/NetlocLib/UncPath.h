//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <string>
#include <string_view>

#include "Utils/Result.h"

namespace Netloc {

//
// UncPath is the '\\server\share' identity of a network location, trailing components are not part of it
//

class UncPath
{
public:
    static constexpr wchar_t kSeparator = L'\\';

    static Result<UncPath> Parse(const wchar_t* path);
    static Result<UncPath> Parse(std::wstring_view path);

    const std::wstring& ServerName() const { return m_serverName; }
    const std::wstring& ShareName() const { return m_shareName; }

    // '\\{serverName}\{shareName}'
    std::wstring RootPath() const;

private:
    UncPath(std::wstring serverName, std::wstring shareName);

    std::wstring m_serverName;
    std::wstring m_shareName;
};

// True if 'text' is empty or only made of whitespaces
bool IsBlank(std::wstring_view text);

}  // namespace Netloc

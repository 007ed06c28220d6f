//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Netloc {

struct Option
{
    Option(std::wstring_view k, std::optional<std::wstring_view> v)
        : key(k)
        , value(v)
        , isParsed(false)
    {
    }

    std::wstring key;
    std::optional<std::wstring> value;
    bool isParsed;
};

// Strip the leading '/' or '-' of a command line switch, return an empty optional when 'input' is not a switch
std::optional<std::wstring_view> ToSwitch(std::wstring_view input);

// Match '/name' or '/name=value' case insensitively, 'value' is left empty for '/name'
bool ParseSwitch(std::wstring_view input, std::wstring_view name, std::optional<std::wstring>& value);

// Split 'log:file,output=netloc.log,level=debug' into options once the part before ':' matches 'argument'
bool ParseSubArguments(std::wstring_view input, std::wstring_view argument, std::vector<Option>& subOptions);

// Keys are lowered, empty items are skipped
void ToOptions(std::wstring_view optionString, std::vector<Option>& options);

// Inverse of ToOptions, each item is wrapped with 'prefix' and 'suffix'
std::wstring Join(
    const std::vector<Option>& options,
    const std::wstring& prefix,
    const std::wstring& suffix,
    const std::wstring& separator);

}  // namespace Netloc

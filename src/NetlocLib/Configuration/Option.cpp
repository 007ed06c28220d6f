//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "Configuration/Option.h"

#include <boost/algorithm/string.hpp>

using namespace Netloc;

namespace {

struct KeyValue
{
    std::wstring_view key;
    std::optional<std::wstring_view> value;
};

// Only the first '=' separates, 'value' may contain more
KeyValue SplitKeyValue(std::wstring_view item)
{
    const auto equal = item.find(L'=');
    if (equal == std::wstring_view::npos)
    {
        return {item, std::nullopt};
    }

    return {item.substr(0, equal), item.substr(equal + 1)};
}

}  // namespace

namespace Netloc {

std::optional<std::wstring_view> ToSwitch(std::wstring_view input)
{
    if (input.size() <= 1)
    {
        return {};
    }

    if (input.front() != L'/' && input.front() != L'-')
    {
        return {};
    }

    return input.substr(1);
}

bool ParseSwitch(std::wstring_view input, std::wstring_view name, std::optional<std::wstring>& value)
{
    const auto [key, parameter] = SplitKeyValue(input);
    if (!boost::iequals(key, name))
    {
        return false;
    }

    if (parameter)
    {
        value = std::wstring(*parameter);
    }
    else
    {
        value.reset();
    }

    return true;
}

void ToOptions(std::wstring_view optionString, std::vector<Option>& options)
{
    std::vector<std::wstring> items;
    boost::split(items, optionString, boost::is_any_of(L","), boost::token_compress_on);

    for (const auto& item : items)
    {
        if (item.empty())
        {
            continue;
        }

        const auto [key, value] = SplitKeyValue(item);
        options.emplace_back(boost::to_lower_copy(std::wstring(key)), value);
    }
}

bool ParseSubArguments(std::wstring_view input, std::wstring_view argument, std::vector<Option>& options)
{
    const auto colon = input.find(L':');
    if (colon == std::wstring_view::npos || !boost::iequals(input.substr(0, colon), argument))
    {
        return false;
    }

    ToOptions(input.substr(colon + 1), options);
    return true;
}

std::wstring Join(
    const std::vector<Option>& options,
    const std::wstring& prefix,
    const std::wstring& suffix,
    const std::wstring& separator)
{
    std::wstring joined;

    for (auto it = std::cbegin(options); it != std::cend(options); ++it)
    {
        if (it != std::cbegin(options))
        {
            joined += separator;
        }

        joined += prefix;
        joined += it->key;
        if (it->value)
        {
            joined += L'=';
            joined += *it->value;
        }

        joined += suffix;
    }

    return joined;
}

}  // namespace Netloc

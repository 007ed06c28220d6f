//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <algorithm>
#include <cwctype>
#include <functional>
#include <string>
#include <string_view>

namespace Netloc {

// Folding shared by comparison and hashing: equal strings always have the same hash
inline wchar_t FoldCase(wchar_t c)
{
    return static_cast<wchar_t>(std::towlower(static_cast<std::wint_t>(c)));
}

inline bool equalCaseInsensitive(std::wstring_view lhs, std::wstring_view rhs)
{
    return std::equal(
        std::cbegin(lhs), std::cend(lhs), std::cbegin(rhs), std::cend(rhs), [](wchar_t c1, wchar_t c2) {
            return FoldCase(c1) == FoldCase(c2);
        });
}

inline bool lessCaseInsensitive(std::wstring_view lhs, std::wstring_view rhs)
{
    return std::lexicographical_compare(
        std::cbegin(lhs), std::cend(lhs), std::cbegin(rhs), std::cend(rhs), [](wchar_t c1, wchar_t c2) {
            return FoldCase(c1) < FoldCase(c2);
        });
}

inline size_t hashCaseInsensitive(std::wstring_view value)
{
    std::wstring folded(value.size(), L'\0');
    std::transform(std::cbegin(value), std::cend(value), std::begin(folded), FoldCase);
    return std::hash<std::wstring> {}(folded);
}

struct CaseInsensitive
{
    bool operator()(std::wstring_view lhs, std::wstring_view rhs) const { return lessCaseInsensitive(lhs, rhs); }
};

}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <cstddef>
#include <type_traits>

namespace Netloc {
namespace Traits {

namespace detail {

template <typename T>
struct char_type_of : char_type_of<std::remove_cv_t<typename T::value_type>>
{
};

template <>
struct char_type_of<char>
{
    using type = char;
};

template <>
struct char_type_of<wchar_t>
{
    using type = wchar_t;
};

template <typename T>
struct char_type_of<T*> : char_type_of<std::remove_cv_t<T>>
{
};

template <typename T, size_t N>
struct char_type_of<T[N]> : char_type_of<std::remove_cv_t<T>>
{
};

}  // namespace detail

//
// Character type of a string like argument: literal, pointer, std::basic_string[_view] or fmt::basic_string_view
//
template <typename T>
using underlying_char_type_t = typename detail::char_type_of<std::remove_cv_t<std::remove_reference_t<T>>>::type;

}  // namespace Traits
}  // namespace Netloc

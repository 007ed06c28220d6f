//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2020 ANSSI. All Rights Reserved.
//
// Author(s): fabienfl (ANSSI)
//

#pragma once

#include <system_error>
#include <utility>

#include <boost/outcome/outcome.hpp>

#ifdef _WIN32
#    include <windows.h>
#endif

namespace Netloc {

//
// Value or std::error_code, domain errors are 'NetworkLocationErrc' values
//

template <typename T>
class Result : public boost::outcome_v2::std_result<T>
{
public:
    using Base = boost::outcome_v2::std_result<T>;

    template <typename... Args>
    Result(Args&&... args)
        : Base(std::forward<Args>(args)...)
    {
    }

    const T* operator->() const { return &Base::value(); }
    T* operator->() { return &Base::value(); }

    const T& operator*() const& { return Base::value(); }
    T& operator*() & { return Base::value(); }
    T&& operator*() && { return std::move(Base::value()); }
};

template <>
class Result<void> : public boost::outcome_v2::std_result<void>
{
public:
    using Base = boost::outcome_v2::std_result<void>;

    template <typename... Args>
    Result(Args&&... args)
        : Base(std::forward<Args>(args)...)
    {
    }
};

inline Result<void> Success()
{
    return boost::outcome_v2::success();
}

#ifdef _WIN32

// HRESULT returned by COM or shell api
inline std::error_code SystemError(HRESULT hr)
{
    return {hr, std::system_category()};
}

#endif

}  // namespace Netloc

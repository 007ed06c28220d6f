//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <string>
#include <system_error>

namespace Netloc {

enum class NetworkLocationErrc
{
    InvalidInput = 1,
    MalformedUnc,
    NotFound,
    IOFailure
};

class network_location_error_category_t : public std::error_category
{
public:
    const char* name() const noexcept override;
    std::error_condition default_error_condition(int c) const noexcept override;
    std::string message(int ev) const override;
};

const network_location_error_category_t& network_location_error_category();

inline std::error_code make_error_code(NetworkLocationErrc e)
{
    return {static_cast<int>(e), network_location_error_category()};
}

}  // namespace Netloc

namespace std {

template <>
struct is_error_code_enum<Netloc::NetworkLocationErrc> : true_type
{
};

}  // namespace std

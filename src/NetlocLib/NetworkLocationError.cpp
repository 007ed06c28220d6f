//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "NetworkLocationError.h"

namespace Netloc {

const network_location_error_category_t& network_location_error_category()
{
    static network_location_error_category_t category;
    return category;
}

const char* network_location_error_category_t::name() const noexcept
{
    return "netloc";
}

std::error_condition network_location_error_category_t::default_error_condition(int c) const noexcept
{
    switch (static_cast<NetworkLocationErrc>(c))
    {
        case NetworkLocationErrc::InvalidInput:
        case NetworkLocationErrc::MalformedUnc:
            return std::make_error_condition(std::errc::invalid_argument);
        case NetworkLocationErrc::NotFound:
            return std::make_error_condition(std::errc::no_such_file_or_directory);
        case NetworkLocationErrc::IOFailure:
            return std::make_error_condition(std::errc::io_error);
        default:
            return std::error_condition(c, *this);
    }
}

std::string network_location_error_category_t::message(int ev) const
{
    switch (static_cast<NetworkLocationErrc>(ev))
    {
        case NetworkLocationErrc::InvalidInput:
            return "Invalid input";
        case NetworkLocationErrc::MalformedUnc:
            return "Malformed UNC path";
        case NetworkLocationErrc::NotFound:
            return "Network location shortcut not found";
        case NetworkLocationErrc::IOFailure:
            return "Network location shortcut I/O failure";
        default:
            return "<Missing description>";
    }
}

}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <cstdint>
#include <system_error>

#include <gsl/span>

namespace Netloc {

using BufferView = gsl::span<const uint8_t>;

template <typename ContainerT>
inline BufferView ToBufferView(const ContainerT& container)
{
    return BufferView(
        reinterpret_cast<const uint8_t*>(container.data()),
        container.size() * sizeof(typename ContainerT::value_type));
}

// View from 'offset' to the end of 'buffer', 'result_out_of_range' when 'offset' is past the end
inline BufferView MakeSubView(BufferView buffer, uint64_t offset, std::error_code& ec)
{
    if (offset > buffer.size())
    {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return {};
    }

    return buffer.subspan(static_cast<size_t>(offset));
}

}  // namespace Netloc

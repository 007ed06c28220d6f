//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <string>
#include <system_error>

#include "Utils/BufferView.h"

namespace Netloc {
namespace ShellLink {

// NUL terminated ansi string starting at 'offset'
std::wstring ReadAnsiString(BufferView buffer, uint64_t offset, std::error_code& ec);

// NUL terminated UTF-16LE string starting at 'offset'
std::wstring ReadUnicodeString(BufferView buffer, uint64_t offset, std::error_code& ec);

}  // namespace ShellLink
}  // namespace Netloc

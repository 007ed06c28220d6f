//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "Utils/Result.h"

namespace Netloc {

//
// Shell link resolution of the entries of a shortcut container
//

class IShellLinkResolver
{
public:
    virtual ~IShellLinkResolver() = default;

    // Check the shell can browse 'container'
    virtual Result<void> Open(const std::filesystem::path& container) = 0;

    // Target path of 'container\entryName', empty if the entry is missing or is not a link
    virtual Result<std::optional<std::wstring>>
    ResolveLinkTarget(const std::filesystem::path& container, std::wstring_view entryName) = 0;
};

}  // namespace Netloc

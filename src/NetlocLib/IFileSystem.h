//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <filesystem>
#include <vector>

#include "Utils/Result.h"

namespace Netloc {

class IFileSystem
{
public:
    virtual ~IFileSystem() = default;

    virtual bool Exists(const std::filesystem::path& path) const = 0;
    virtual bool IsDirectory(const std::filesystem::path& path) const = 0;

    // Entries of 'container' in listing order, an error if the container cannot be listed
    virtual Result<std::vector<std::filesystem::path>> ListEntries(const std::filesystem::path& container) const = 0;

    virtual Result<void> Rename(const std::filesystem::path& entry, const std::filesystem::path& newPath) = 0;
};

}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include "IFileSystem.h"

namespace Netloc {

class FileSystem final : public IFileSystem
{
public:
    bool Exists(const std::filesystem::path& path) const override;
    bool IsDirectory(const std::filesystem::path& path) const override;

    Result<std::vector<std::filesystem::path>> ListEntries(const std::filesystem::path& container) const override;

    Result<void> Rename(const std::filesystem::path& entry, const std::filesystem::path& newPath) override;
};

}  // namespace Netloc

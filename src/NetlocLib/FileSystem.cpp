//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "FileSystem.h"

#include "Log/Log.h"

namespace fs = std::filesystem;

namespace Netloc {

bool FileSystem::Exists(const fs::path& path) const
{
    std::error_code ec;
    const auto exists = fs::exists(path, ec);
    if (ec)
    {
        Log::Debug(L"Failed to check existence of '{}' [{}]", path.wstring(), ec);
        return false;
    }

    return exists;
}

bool FileSystem::IsDirectory(const fs::path& path) const
{
    std::error_code ec;
    const auto isDirectory = fs::is_directory(path, ec);
    if (ec)
    {
        Log::Debug(L"Failed to check directory '{}' [{}]", path.wstring(), ec);
        return false;
    }

    return isDirectory;
}

Result<std::vector<fs::path>> FileSystem::ListEntries(const fs::path& container) const
{
    std::error_code ec;
    fs::directory_iterator it(container, ec);
    if (ec)
    {
        Log::Debug(L"Failed to list '{}' [{}]", container.wstring(), ec);
        return ec;
    }

    std::vector<fs::path> entries;
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        entries.push_back(it->path());
    }

    if (ec)
    {
        Log::Debug(L"Failed to list '{}' [{}]", container.wstring(), ec);
        return ec;
    }

    return entries;
}

Result<void> FileSystem::Rename(const fs::path& entry, const fs::path& newPath)
{
    std::error_code ec;
    const auto exists = fs::exists(newPath, ec);
    if (ec)
    {
        Log::Debug(L"Failed to check existence of '{}' [{}]", newPath.wstring(), ec);
        return ec;
    }

    // fs::rename would replace an existing file
    if (exists)
    {
        return std::make_error_code(std::errc::file_exists);
    }

    fs::rename(entry, newPath, ec);
    if (ec)
    {
        return ec;
    }

    return Success();
}

}  // namespace Netloc

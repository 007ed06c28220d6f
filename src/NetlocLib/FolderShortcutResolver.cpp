//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "FolderShortcutResolver.h"

#include <fstream>
#include <iterator>

#include <boost/algorithm/string/predicate.hpp>

#include "Log/Log.h"
#include "ShellLink/ShellLink.h"
#include "Text/Iconv.h"

namespace fs = std::filesystem;

namespace {

constexpr uintmax_t kMaxDesktopIniSize = 4096;

Netloc::Result<std::string> ReadDesktopIni(const fs::path& path)
{
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec)
    {
        return ec;
    }

    if (size > kMaxDesktopIniSize)
    {
        return std::make_error_code(std::errc::file_too_large);
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file)
    {
        return std::make_error_code(std::errc::io_error);
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    // Explorer may write desktop.ini as UTF-16LE with a BOM
    if (content.size() >= 2 && static_cast<uint8_t>(content[0]) == 0xFF && static_cast<uint8_t>(content[1]) == 0xFE)
    {
        std::u16string utf16;
        for (size_t i = 2; i + 1 < content.size(); i += 2)
        {
            utf16.push_back(
                static_cast<char16_t>(static_cast<uint8_t>(content[i]) | (static_cast<uint8_t>(content[i + 1]) << 8)));
        }

        return Netloc::Utf16ToUtf8(Netloc::FromUtf16(utf16));
    }

    return content;
}

Netloc::Result<std::optional<std::wstring>> ResolveShellLinkFile(const fs::path& path)
{
    auto shellLink = Netloc::ShellLink::ShellLink::Load(path);
    if (!shellLink)
    {
        return shellLink.error();
    }

    return shellLink->Target();
}

}  // namespace

namespace Netloc {

bool FolderShortcutResolver::IsFolderShortcutDesktopIni(std::string_view content)
{
    const auto clsid = Utf16ToUtf8(kFolderShortcutClsid);

    auto pos = content.find('{');
    while (pos != std::string_view::npos)
    {
        const auto end = content.find('}', pos + 1);
        if (end == std::string_view::npos)
        {
            return false;
        }

        if (boost::iequals(content.substr(pos + 1, end - pos - 1), clsid))
        {
            return true;
        }

        pos = content.find('{', end + 1);
    }

    return false;
}

Result<void> FolderShortcutResolver::Open(const fs::path& container)
{
    std::error_code ec;
    const auto isDirectory = fs::is_directory(container, ec);
    if (ec)
    {
        Log::Debug(L"Failed to open shortcut container '{}' [{}]", container.wstring(), ec);
        return ec;
    }

    if (!isDirectory)
    {
        Log::Debug(L"Failed to open shortcut container '{}': not a directory", container.wstring());
        return std::make_error_code(std::errc::not_a_directory);
    }

    return Success();
}

Result<std::optional<std::wstring>>
FolderShortcutResolver::ResolveLinkTarget(const fs::path& container, std::wstring_view entryName)
{
    const auto entry = container / fs::path(std::wstring(entryName));

    std::error_code ec;
    const auto status = fs::status(entry, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        Log::Debug(L"Failed to get status of '{}' [{}]", entry.wstring(), ec);
        return ec;
    }

    if (!fs::exists(status))
    {
        return std::optional<std::wstring>();
    }

    if (fs::is_regular_file(status))
    {
        if (!boost::iequals(entry.extension().wstring(), L".lnk"))
        {
            return std::optional<std::wstring>();
        }

        return ResolveShellLinkFile(entry);
    }

    if (!fs::is_directory(status))
    {
        return std::optional<std::wstring>();
    }

    const auto desktopIni = entry / fs::path(std::wstring(kDesktopIni));
    if (!fs::is_regular_file(desktopIni, ec))
    {
        return std::optional<std::wstring>();
    }

    auto content = ReadDesktopIni(desktopIni);
    if (!content)
    {
        Log::Debug(L"Failed to read '{}' [{}]", desktopIni.wstring(), content.error());
        return content.error();
    }

    if (!IsFolderShortcutDesktopIni(*content))
    {
        return std::optional<std::wstring>();
    }

    const auto targetLnk = entry / fs::path(std::wstring(kTargetLnk));
    if (!fs::is_regular_file(targetLnk, ec))
    {
        return std::optional<std::wstring>();
    }

    return ResolveShellLinkFile(targetLnk);
}

}  // namespace Netloc

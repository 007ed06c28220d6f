//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include "IShellLinkResolver.h"

namespace Netloc {

//
// Resolve shortcut entries without the shell by reading them from disk:
//
//   - a folder shortcut is a directory with a 'desktop.ini' naming the folder shortcut CLSID and a 'target.lnk'
//   - a '.lnk' file is parsed directly
//

class FolderShortcutResolver final : public IShellLinkResolver
{
public:
    static constexpr std::wstring_view kFolderShortcutClsid = L"0AFACED1-E828-11D1-9187-B532F1E9575D";
    static constexpr std::wstring_view kDesktopIni = L"desktop.ini";
    static constexpr std::wstring_view kTargetLnk = L"target.lnk";

    Result<void> Open(const std::filesystem::path& container) override;

    Result<std::optional<std::wstring>>
    ResolveLinkTarget(const std::filesystem::path& container, std::wstring_view entryName) override;

    // Check if 'desktop.ini' content declares the folder shortcut CLSID
    static bool IsFolderShortcutDesktopIni(std::string_view content);
};

}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <windows.h>
#include <atlbase.h>
#include <shlobj.h>

#include "IShellLinkResolver.h"

namespace Netloc {

//
// Resolve shortcut entries through the shell namespace, COM must be initialized by the caller
//

class ComShellLinkResolver final : public IShellLinkResolver
{
public:
    Result<void> Open(const std::filesystem::path& container) override;

    Result<std::optional<std::wstring>>
    ResolveLinkTarget(const std::filesystem::path& container, std::wstring_view entryName) override;

private:
    std::filesystem::path m_container;
    CComPtr<IShellFolder> m_folder;
};

}  // namespace Netloc

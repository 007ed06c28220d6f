//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "ShellLink/IdList.h"
#include "ShellLink/LinkInfo.h"
#include "ShellLink/ShellLinkHeader.h"
#include "Utils/BufferView.h"
#include "Utils/Result.h"

namespace Netloc {
namespace ShellLink {

//
// Shell link (.lnk) file parser, see [MS-SHLLINK]
//
// Only the structures locating the link target are decoded: the header, the LinkTargetIDList and the LinkInfo.
//

class ShellLink final
{
public:
    static void Parse(BufferView buffer, ShellLink& shellLink, std::error_code& ec);

    static Result<ShellLink> Load(const std::filesystem::path& path);

    const ShellLinkHeader& Header() const { return m_header; }
    const std::optional<IdList>& LinkTargetIdList() const { return m_idList; }
    const std::optional<LinkInfo>& Info() const { return m_linkInfo; }

    // Resolved target path: from LinkInfo when available, else from the network items of the id list
    std::optional<std::wstring> Target() const;

private:
    ShellLinkHeader m_header;
    std::optional<IdList> m_idList;
    std::optional<LinkInfo> m_linkInfo;
};

}  // namespace ShellLink
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <string>
#include <string_view>

#include "Utils/Result.h"

namespace Netloc {

//
// Externalized form of a NetworkLocation, rendered as 'key=value' lines:
//
//   ShareName=data
//   ServerName=192.168.100.1
//   RootDirectory=\\192.168.100.1\data
//   ShortcutFile=C:\Users\foo\AppData\Roaming\Microsoft\Windows\Network Shortcuts\data (192.168.100.1)
//

struct NetworkLocationRecord
{
    static constexpr std::wstring_view kShareName = L"ShareName";
    static constexpr std::wstring_view kServerName = L"ServerName";
    static constexpr std::wstring_view kRootDirectory = L"RootDirectory";
    static constexpr std::wstring_view kShortcutFile = L"ShortcutFile";

    std::wstring shareName;
    std::wstring serverName;
    std::wstring rootDirectory;
    std::wstring shortcutFile;

    std::wstring Serialize() const;

    // Every key is required exactly once, blank lines are ignored
    static Result<NetworkLocationRecord> Deserialize(std::wstring_view text);

    bool operator==(const NetworkLocationRecord& other) const;
    bool operator!=(const NetworkLocationRecord& other) const { return !(*this == other); }
};

}  // namespace Netloc

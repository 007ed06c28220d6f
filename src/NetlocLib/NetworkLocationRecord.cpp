//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "NetworkLocationRecord.h"

#include <map>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <fmt/xchar.h>

#include "Log/Log.h"
#include "NetworkLocationError.h"
#include "UncPath.h"

namespace Netloc {

std::wstring NetworkLocationRecord::Serialize() const
{
    fmt::wmemory_buffer out;
    fmt::format_to(std::back_inserter(out), L"{}={}\n", kShareName, shareName);
    fmt::format_to(std::back_inserter(out), L"{}={}\n", kServerName, serverName);
    fmt::format_to(std::back_inserter(out), L"{}={}\n", kRootDirectory, rootDirectory);
    fmt::format_to(std::back_inserter(out), L"{}={}\n", kShortcutFile, shortcutFile);
    return fmt::to_string(out);
}

Result<NetworkLocationRecord> NetworkLocationRecord::Deserialize(std::wstring_view text)
{
    NetworkLocationRecord record;
    const std::map<std::wstring_view, std::wstring*> fields = {
        {kShareName, &record.shareName},
        {kServerName, &record.serverName},
        {kRootDirectory, &record.rootDirectory},
        {kShortcutFile, &record.shortcutFile}};

    std::vector<std::wstring> lines;
    boost::split(lines, text, boost::is_any_of(L"\n"));

    std::map<std::wstring_view, bool> parsed;
    for (auto& line : lines)
    {
        boost::trim_right_if(line, boost::is_any_of(L"\r"));
        if (IsBlank(line))
        {
            continue;
        }

        const auto separatorPos = line.find_first_of(L'=');
        if (separatorPos == std::wstring::npos)
        {
            Log::Debug(L"Failed to parse network location record: missing separator in '{}'", line);
            return make_error_code(NetworkLocationErrc::InvalidInput);
        }

        const auto key = std::wstring_view(line).substr(0, separatorPos);
        const auto it = fields.find(key);
        if (it == std::cend(fields))
        {
            Log::Debug(L"Failed to parse network location record: unknown key '{}'", key);
            return make_error_code(NetworkLocationErrc::InvalidInput);
        }

        if (parsed[it->first])
        {
            Log::Debug(L"Failed to parse network location record: duplicate key '{}'", key);
            return make_error_code(NetworkLocationErrc::InvalidInput);
        }

        parsed[it->first] = true;
        *it->second = line.substr(separatorPos + 1);
    }

    for (const auto& field : fields)
    {
        if (!parsed[field.first])
        {
            Log::Debug(L"Failed to parse network location record: missing key '{}'", field.first);
            return make_error_code(NetworkLocationErrc::InvalidInput);
        }
    }

    return record;
}

bool NetworkLocationRecord::operator==(const NetworkLocationRecord& other) const
{
    return shareName == other.shareName && serverName == other.serverName && rootDirectory == other.rootDirectory
        && shortcutFile == other.shortcutFile;
}

}  // namespace Netloc

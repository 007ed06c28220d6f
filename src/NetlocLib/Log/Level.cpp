//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "Log/Level.h"

#include <array>
#include <utility>

#include "CaseInsensitive.h"

using namespace std::literals;

namespace Netloc {
namespace Log {

namespace {

constexpr std::array<std::pair<Level, std::wstring_view>, 7> kLevelNames = {{
    {Level::Trace, L"trace"sv},
    {Level::Debug, L"debug"sv},
    {Level::Info, L"info"sv},
    {Level::Warning, L"warning"sv},
    {Level::Error, L"error"sv},
    {Level::Critical, L"critical"sv},
    {Level::Off, L"off"sv},
}};

}  // namespace

std::wstring_view ToString(Level level)
{
    for (const auto& [value, name] : kLevelNames)
    {
        if (value == level)
        {
            return name;
        }
    }

    return L"unknown"sv;
}

Result<Level> ToLevel(std::wstring_view name)
{
    if (equalCaseInsensitive(name, L"warn"sv))
    {
        return Level::Warning;
    }

    for (const auto& [value, levelName] : kLevelNames)
    {
        if (equalCaseInsensitive(name, levelName))
        {
            return value;
        }
    }

    return std::make_error_code(std::errc::invalid_argument);
}

}  // namespace Log
}  // namespace Netloc

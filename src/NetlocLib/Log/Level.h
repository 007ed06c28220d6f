//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <cstdint>
#include <string_view>

#include <spdlog/common.h>

#include "Utils/Result.h"

namespace Netloc {
namespace Log {

// Values are spdlog's so that both can be cast into each other
enum class Level : uint16_t
{
    Trace = SPDLOG_LEVEL_TRACE,
    Debug = SPDLOG_LEVEL_DEBUG,
    Info = SPDLOG_LEVEL_INFO,
    Warning = SPDLOG_LEVEL_WARN,
    Error = SPDLOG_LEVEL_ERROR,
    Critical = SPDLOG_LEVEL_CRITICAL,
    Off = SPDLOG_LEVEL_OFF,
    LevelCount
};

std::wstring_view ToString(Level level);

// Case insensitive, 'warn' is accepted for 'warning'
Result<Level> ToLevel(std::wstring_view name);

}  // namespace Log
}  // namespace Netloc

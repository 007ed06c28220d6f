//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <memory>

#include "Log/Logger.h"
#include "Text/Fmt/std_error_code.h"

//
// Free logging functions forwarding to the process wide logger, they are no-ops until one is installed
//

namespace Netloc {
namespace Log {

std::shared_ptr<Logger>& DefaultLogger();

void SetDefaultLogger(std::shared_ptr<Logger> instance);

namespace detail {

template <typename Fn>
inline void WithDefaultLogger(Fn&& fn)
{
    if (const auto& logger = DefaultLogger())
    {
        fn(*logger);
    }
}

}  // namespace detail

template <typename... Args>
void Trace(Args&&... args)
{
    detail::WithDefaultLogger([&](Logger& logger) { logger.Trace(std::forward<Args>(args)...); });
}

template <typename... Args>
void Debug(Args&&... args)
{
    detail::WithDefaultLogger([&](Logger& logger) { logger.Debug(std::forward<Args>(args)...); });
}

template <typename... Args>
void Info(Args&&... args)
{
    detail::WithDefaultLogger([&](Logger& logger) { logger.Info(std::forward<Args>(args)...); });
}

template <typename... Args>
void Warn(Args&&... args)
{
    detail::WithDefaultLogger([&](Logger& logger) { logger.Warn(std::forward<Args>(args)...); });
}

template <typename... Args>
void Error(Args&&... args)
{
    detail::WithDefaultLogger([&](Logger& logger) { logger.Error(std::forward<Args>(args)...); });
}

template <typename... Args>
void Critical(Args&&... args)
{
    detail::WithDefaultLogger([&](Logger& logger) { logger.Critical(std::forward<Args>(args)...); });
}

inline void Flush()
{
    detail::WithDefaultLogger([](Logger& logger) { logger.Flush(); });
}

}  // namespace Log
}  // namespace Netloc

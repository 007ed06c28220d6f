//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/xchar.h>
#include <spdlog/logger.h>

#include "Log/SpdlogSink.h"

namespace Netloc {
namespace Log {

// Ex: '2021-03-02T09:12:55.021Z [W] Network shortcut 'Data' has no link target'
// See https://github.com/gabime/spdlog/wiki/3.-Custom-formatting, '%^' and '%$' delimit the colored range
constexpr auto kDefaultLogPattern = "%^%Y-%m-%dT%T.%eZ [%L] %v%$";

//
// One facility: a named spdlog::logger and the sinks it writes to. The logger level is the upstream filter, each
// sink can filter further.
//
class SpdlogLogger
{
public:
    using Ptr = std::shared_ptr<SpdlogLogger>;

    explicit SpdlogLogger(const std::string& name)
        : m_logger(std::make_shared<spdlog::logger>(name))
    {
    }

    void Add(SpdlogSink::Ptr sink);

    void SetLevel(Log::Level level) { m_logger->set_level(ToSpdlog(level)); }

    // Applied to every sink added so far
    void SetPattern(const std::string& pattern);

    void SetErrorHandler(std::function<void(const std::string&)> handler);

    void SetAsDefaultLogger();

    bool ShouldLog(Log::Level level) const { return m_logger->should_log(ToSpdlog(level)); }

    void Log(const std::chrono::system_clock::time_point& timepoint, Log::Level level, fmt::string_view msg)
    {
        m_logger->log(timepoint, spdlog::source_loc {}, ToSpdlog(level), spdlog::string_view_t(msg.data(), msg.size()));
    }

    // Converted to utf-8 before reaching spdlog
    void Log(const std::chrono::system_clock::time_point& timepoint, Log::Level level, fmt::wstring_view msg);

    void Flush() { m_logger->flush(); }

private:
    static spdlog::level::level_enum ToSpdlog(Log::Level level)
    {
        return static_cast<spdlog::level::level_enum>(level);
    }

    std::shared_ptr<spdlog::logger> m_logger;
    std::vector<SpdlogSink::Ptr> m_sinks;
};

}  // namespace Log
}  // namespace Netloc

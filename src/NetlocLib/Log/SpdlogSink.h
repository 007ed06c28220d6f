//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright 2020 ANSSI. All Rights Reserved.
//
// Author(s): fabienfl
//

#pragma once

#include <memory>

#include <spdlog/logger.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/sink.h>

#include "Log/Level.h"

namespace Netloc {
namespace Log {

//
// Netloc sink handle: spdlog sinks are shared between the facility loggers, level and format are set on the sink
//
class SpdlogSink
{
public:
    using Ptr = std::shared_ptr<SpdlogSink>;

    explicit SpdlogSink(std::shared_ptr<spdlog::sinks::sink> sink)
        : m_sink(std::move(sink))
    {
    }

    virtual ~SpdlogSink() = default;

    void AddTo(spdlog::logger& logger) { logger.sinks().push_back(m_sink); }

    Log::Level Level() const { return static_cast<Log::Level>(m_sink->level()); }
    void SetLevel(Log::Level level) { m_sink->set_level(static_cast<spdlog::level::level_enum>(level)); }

    // A null formatter restores spdlog's default pattern
    void SetFormatter(std::unique_ptr<spdlog::formatter> formatter)
    {
        if (formatter == nullptr)
        {
            formatter = std::make_unique<spdlog::pattern_formatter>();
        }

        m_sink->set_formatter(std::move(formatter));
    }

    // Timestamps are always UTC
    void SetPattern(const std::string& pattern)
    {
        SetFormatter(std::make_unique<spdlog::pattern_formatter>(pattern, spdlog::pattern_time_type::utc));
    }

    void Flush() { m_sink->flush(); }

protected:
    std::shared_ptr<spdlog::sinks::sink> m_sink;
};

}  // namespace Log
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "Log/SpdlogLogger.h"

#include <spdlog/spdlog.h>

#include "Text/Iconv.h"

namespace Netloc {
namespace Log {

void SpdlogLogger::Add(SpdlogSink::Ptr sink)
{
    if (!sink)
    {
        return;
    }

    sink->AddTo(*m_logger);
    m_sinks.push_back(std::move(sink));
}

void SpdlogLogger::SetPattern(const std::string& pattern)
{
    for (const auto& sink : m_sinks)
    {
        sink->SetPattern(pattern);
    }
}

void SpdlogLogger::SetErrorHandler(std::function<void(const std::string&)> handler)
{
    m_logger->set_error_handler(std::move(handler));
}

void SpdlogLogger::SetAsDefaultLogger()
{
    spdlog::set_default_logger(m_logger);
}

void SpdlogLogger::Log(const std::chrono::system_clock::time_point& timepoint, Log::Level level, fmt::wstring_view msg)
{
    if (!ShouldLog(level))
    {
        return;
    }

    const auto utf8 = Utf16ToUtf8(std::wstring_view(msg.data(), msg.size()));
    Log(timepoint, level, fmt::string_view(utf8.data(), utf8.size()));
}

}  // namespace Log
}  // namespace Netloc

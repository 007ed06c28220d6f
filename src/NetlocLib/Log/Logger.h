//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/xchar.h>

#include "Log/SpdlogLogger.h"
#include "Utils/TypeTraits.h"

namespace Netloc {
namespace Log {

//
// Owns one SpdlogLogger per facility and forwards each record to the facilities registered as defaults.
// Every record is counted by level, whether or not a facility accepts it.
//
class Logger
{
public:
    enum class Facility : size_t
    {
        kConsole = 0,
        kLogFile,
        kUnitTest,
        kFacilityCount
    };

    using FacilityLogger = std::pair<Facility, SpdlogLogger::Ptr>;

    Logger(std::initializer_list<FacilityLogger> loggers = {});

    uint64_t Count(Level level) const;

    uint64_t warningCount() const { return Count(Level::Warning); }
    uint64_t errorCount() const { return Count(Level::Error); }
    uint64_t criticalCount() const { return Count(Level::Critical); }

    template <typename... Args>
    void Trace(Args&&... args)
    {
        Dispatch(Level::Trace, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Debug(Args&&... args)
    {
        Dispatch(Level::Debug, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Info(Args&&... args)
    {
        Dispatch(Level::Info, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Warn(Args&&... args)
    {
        Dispatch(Level::Warning, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Error(Args&&... args)
    {
        Dispatch(Level::Error, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Critical(Args&&... args)
    {
        Dispatch(Level::Critical, std::forward<Args>(args)...);
    }

    void Flush();

    // Null when nothing was registered for 'facility'
    const SpdlogLogger::Ptr& Get(Facility facility) const;

    void AddToDefaultFacilities(Facility facility);

private:
    template <typename CharT, typename... Args>
    static bool
    FormatTo(fmt::basic_memory_buffer<CharT>& out, std::basic_string_view<CharT> format, const Args&... args)
    {
        try
        {
            if constexpr (std::is_same_v<CharT, char>)
            {
                fmt::vformat_to(std::back_inserter(out), fmt::string_view(format), fmt::make_format_args(args...));
            }
            else
            {
                fmt::vformat_to(
                    std::back_inserter(out), fmt::wstring_view(format), fmt::make_wformat_args(args...));
            }
        }
        catch (const fmt::format_error&)
        {
            out.clear();
            return false;
        }

        return true;
    }

    template <typename Format, typename... Args>
    void Dispatch(Level level, Format&& format, Args&&... args)
    {
        using CharT = Traits::underlying_char_type_t<Format>;

        const auto timepoint = std::chrono::system_clock::now();
        const std::basic_string_view<CharT> pattern(format);

        m_counters[static_cast<size_t>(level)]++;

        // Formatting is deferred until a facility actually accepts the level
        std::optional<bool> formatted;
        fmt::basic_memory_buffer<CharT> message;

        for (const auto& logger : m_defaults)
        {
            if (!logger->ShouldLog(level))
            {
                continue;
            }

            if (!formatted)
            {
                formatted = FormatTo(message, pattern, args...);
            }

            if (*formatted)
            {
                logger->Log(timepoint, level, std::basic_string_view<CharT>(message.data(), message.size()));
            }
            else
            {
                logger->Log(timepoint, level, fmt::string_view("Failed to format log message"));
                logger->Log(timepoint, level, pattern);
            }
        }
    }

    std::vector<SpdlogLogger::Ptr> m_facilities;
    std::vector<SpdlogLogger::Ptr> m_defaults;
    std::array<std::atomic<uint64_t>, static_cast<size_t>(Level::LevelCount)> m_counters;
};

using Facility = Logger::Facility;

}  // namespace Log

using Logger = Netloc::Log::Logger;

}  // namespace Netloc

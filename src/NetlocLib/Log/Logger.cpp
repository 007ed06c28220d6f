//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "Log/Logger.h"

#include <algorithm>

namespace Netloc {
namespace Log {

Logger::Logger(std::initializer_list<FacilityLogger> loggers)
    : m_facilities(static_cast<size_t>(Facility::kFacilityCount))
{
    std::fill(std::begin(m_counters), std::end(m_counters), 0);

    for (const auto& [facility, logger] : loggers)
    {
        const auto index = static_cast<size_t>(facility);
        if (index >= m_facilities.size() || m_facilities[index] || !logger)
        {
            continue;
        }

        m_facilities[index] = logger;
    }

    if (const auto& console = Get(Facility::kConsole))
    {
        console->SetAsDefaultLogger();
    }
}

uint64_t Logger::Count(Level level) const
{
    const auto index = static_cast<size_t>(level);
    if (index >= m_counters.size())
    {
        return 0;
    }

    return m_counters[index];
}

void Logger::Flush()
{
    for (const auto& logger : m_facilities)
    {
        if (logger)
        {
            logger->Flush();
        }
    }
}

const SpdlogLogger::Ptr& Logger::Get(Facility facility) const
{
    static const SpdlogLogger::Ptr none;

    const auto index = static_cast<size_t>(facility);
    return index < m_facilities.size() ? m_facilities[index] : none;
}

void Logger::AddToDefaultFacilities(Facility facility)
{
    const auto& logger = Get(facility);
    if (!logger || std::find(std::cbegin(m_defaults), std::cend(m_defaults), logger) != std::cend(m_defaults))
    {
        return;
    }

    m_defaults.push_back(logger);
}

}  // namespace Log
}  // namespace Netloc

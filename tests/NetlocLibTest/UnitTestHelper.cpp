//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2011-2019 ANSSI. All Rights Reserved.
//
// Author(s): Jean Gautier (ANSSI)
//

#include "UnitTestHelper.h"

#include <random>

#include <fmt/xchar.h>

#include "Log/Log.h"

using namespace Netloc;
using namespace Netloc::Test;

namespace fs = std::filesystem;

UnitTestHelper::UnitTestHelper()
    : m_previousLogger(Log::DefaultLogger())
    , m_sink(std::make_shared<MemorySinkT>(kLogCapacity))
{
    auto sink = std::make_shared<Log::SpdlogSink>(m_sink);
    sink->SetPattern("[%L] %v");
    sink->SetLevel(Log::Level::Trace);

    auto logger = std::make_shared<Log::SpdlogLogger>("unittest");
    logger->Add(std::move(sink));
    logger->SetLevel(Log::Level::Trace);

    m_logger = std::make_shared<Netloc::Logger>(
        std::initializer_list<std::pair<Log::Facility, Log::SpdlogLogger::Ptr>> {{Log::Facility::kUnitTest, logger}});
    m_logger->AddToDefaultFacilities(Log::Facility::kUnitTest);

    Log::SetDefaultLogger(m_logger);
}

UnitTestHelper::~UnitTestHelper()
{
    Log::SetDefaultLogger(m_previousLogger);

    for (const auto& directory : m_temporaryDirectories)
    {
        std::error_code ec;
        fs::remove_all(directory, ec);
    }
}

std::string UnitTestHelper::Logs() const
{
    m_logger->Flush();
    return m_sink->buffer();
}

fs::path UnitTestHelper::CreateTemporaryDirectory(std::wstring_view prefix)
{
    std::random_device device;
    std::mt19937_64 generator(device());

    const auto directory = fs::temp_directory_path() / fs::path(fmt::format(L"{}-{:016x}", prefix, generator()));
    fs::create_directories(directory);

    m_temporaryDirectories.push_back(directory);
    return directory;
}

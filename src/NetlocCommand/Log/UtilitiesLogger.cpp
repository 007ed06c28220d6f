//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "Log/UtilitiesLogger.h"

#include <iostream>

#include "Log/Log.h"

using namespace Netloc::Log;
using namespace Netloc;

namespace Netloc {
namespace Command {

std::unique_ptr<SpdlogLogger> UtilitiesLogger::CreateSpdlogLogger(const std::string& name)
{
    auto logger = std::make_unique<SpdlogLogger>(name);

    // Reached on spdlog internal failures, the default logger cannot be used from there
    logger->SetErrorHandler([](const std::string& msg) { std::cerr << "spdlog: " << msg << std::endl; });

    logger->SetLevel(Level::Debug);
    return logger;
}

UtilitiesLogger::ConsoleSink::ConsoleSink()
    : SpdlogSink(std::make_shared<StderrSink>())
{
}

//
// 'console' facility writes to stderr and to the log file, 'file' facility only to the log file. Until configured,
// console only shows critical records while the file sink accepts everything into its backlog.
//
UtilitiesLogger::UtilitiesLogger()
    : m_fileSink(std::make_shared<FileSink>())
    , m_consoleSink(std::make_shared<ConsoleSink>())
{
    m_consoleSink->SetLevel(Level::Critical);
    m_fileSink->SetLevel(Level::Trace);

    SpdlogLogger::Ptr console = CreateSpdlogLogger("default");
    console->Add(m_consoleSink);
    console->Add(m_fileSink);
    console->SetPattern(kDefaultLogPattern);

    SpdlogLogger::Ptr file = CreateSpdlogLogger("file");
    file->Add(m_fileSink);

    m_logger = std::make_shared<Netloc::Logger>(std::initializer_list<Netloc::Logger::FacilityLogger> {
        {Facility::kConsole, std::move(console)}, {Facility::kLogFile, std::move(file)}});

    m_logger->AddToDefaultFacilities(Facility::kConsole);
    SetDefaultLogger(m_logger);
}

UtilitiesLogger::~UtilitiesLogger()
{
    m_logger->Flush();
    SetDefaultLogger(nullptr);
}

void UtilitiesLogger::SetUpstreamLevel(Level level)
{
    for (const auto facility : {Facility::kConsole, Facility::kLogFile})
    {
        if (const auto& logger = m_logger->Get(facility))
        {
            logger->SetLevel(level);
        }
    }
}

}  // namespace Command
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include "Log/Logger.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "Log/Sink/FileSink.h"

namespace Netloc {
namespace Command {

//
// Logging of the command line tool, installed as the process default logger for its lifetime
//
class UtilitiesLogger
{
public:
    class ConsoleSink : public Log::SpdlogSink
    {
    public:
        using StderrSink = spdlog::sinks::stderr_color_sink_mt;

        ConsoleSink();
    };

    class FileSink : public Log::SpdlogSink
    {
    public:
        using Backend = Log::FileSink<std::mutex>;

        FileSink()
            : SpdlogSink(std::make_shared<Backend>())
            , m_file(static_cast<Backend&>(*m_sink))
        {
        }

        void Open(const std::filesystem::path& path, std::error_code& ec) { m_file.Open(path, ec); }
        void Close() { m_file.Close(); }

        bool IsOpen() const { return m_file.IsOpen(); }
        std::optional<std::filesystem::path> OutputPath() const { return m_file.OutputPath(); }

    private:
        Backend& m_file;
    };

    UtilitiesLogger();
    ~UtilitiesLogger();

    Netloc::Logger& logger() { return *m_logger; }
    const Netloc::Logger& logger() const { return *m_logger; }

    const std::shared_ptr<FileSink>& fileSink() const { return m_fileSink; }
    const std::shared_ptr<ConsoleSink>& consoleSink() const { return m_consoleSink; }

    // Level of the facility loggers, records below it never reach any sink
    void SetUpstreamLevel(Log::Level level);

    static std::unique_ptr<Log::SpdlogLogger> CreateSpdlogLogger(const std::string& name);

private:
    std::shared_ptr<FileSink> m_fileSink;
    std::shared_ptr<ConsoleSink> m_consoleSink;
    std::shared_ptr<Netloc::Logger> m_logger;
};

}  // namespace Command
}  // namespace Netloc

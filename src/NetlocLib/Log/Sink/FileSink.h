//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "Log/Sink/MemorySink.h"

namespace Netloc {
namespace Log {

//
// Log file whose path is only known once the command line is parsed. Records logged before 'Open' are kept in a
// bounded backlog which becomes the head of the file.
//
template <typename Mutex>
class FileSink : public spdlog::sinks::base_sink<Mutex>
{
    using Base = spdlog::sinks::base_sink<Mutex>;

public:
    // Both are only reached under Base::mutex_
    using Backend = spdlog::sinks::basic_file_sink_st;
    using Backlog = MemorySink<std::vector<uint8_t>, spdlog::details::null_mutex>;

    static constexpr size_t kBacklogCapacity = 4096;

    FileSink() { m_backlog = NewBacklog(); }

    ~FileSink() override { Close(); }

    void Open(const std::filesystem::path& path, std::error_code& ec)
    {
        std::lock_guard<Mutex> lock(Base::mutex_);

        if (m_backend)
        {
            ec = std::make_error_code(std::errc::device_or_resource_busy);
            return;
        }

        // spdlog reports the path it was given, make it absolute for 'OutputPath'
        auto target = std::filesystem::absolute(path, ec);
        if (ec)
        {
            target = path;
            ec.clear();
        }

        ec = WriteBacklog(target);
        if (ec)
        {
            return;
        }

        try
        {
            m_backend = std::make_unique<Backend>(target.string(), false);
        }
        catch (const spdlog::spdlog_ex&)
        {
            ec = std::make_error_code(std::errc::io_error);
            return;
        }

        m_backend->set_level(spdlog::level::trace);
        m_backend->set_formatter(NewFormatter());
        m_backlog.reset();
    }

    bool IsOpen()
    {
        std::lock_guard<Mutex> lock(Base::mutex_);
        return m_backend != nullptr;
    }

    void Close()
    {
        std::lock_guard<Mutex> lock(Base::mutex_);
        if (!m_backend)
        {
            return;
        }

        m_backend->flush();
        m_backend.reset();
        m_backlog = NewBacklog();
    }

    std::optional<std::filesystem::path> OutputPath() const
    {
        if (!m_backend)
        {
            return {};
        }

        return std::filesystem::path(m_backend->filename());
    }

protected:
    void set_pattern_(const std::string& pattern) override
    {
        set_formatter_(std::make_unique<spdlog::pattern_formatter>(pattern, spdlog::pattern_time_type::utc));
    }

    void set_formatter_(std::unique_ptr<spdlog::formatter> formatter) override
    {
        m_formatter = std::move(formatter);

        if (m_backend)
        {
            m_backend->set_formatter(NewFormatter());
        }
        else if (m_backlog)
        {
            m_backlog->set_formatter(NewFormatter());
        }
    }

    void sink_it_(const spdlog::details::log_msg& msg) override
    {
        if (m_backend)
        {
            m_backend->log(msg);
        }
        else if (m_backlog)
        {
            m_backlog->log(msg);
        }
    }

    void flush_() override
    {
        if (m_backend)
        {
            m_backend->flush();
        }
    }

private:
    std::unique_ptr<spdlog::formatter> NewFormatter() const
    {
        if (m_formatter)
        {
            return m_formatter->clone();
        }

        return std::make_unique<spdlog::pattern_formatter>();
    }

    std::unique_ptr<Backlog> NewBacklog() const
    {
        auto backlog = std::make_unique<Backlog>(kBacklogCapacity);
        backlog->set_formatter(NewFormatter());
        return backlog;
    }

    // Truncates 'path', the backend then appends to it
    std::error_code WriteBacklog(const std::filesystem::path& path) const
    {
        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out)
        {
            return std::make_error_code(std::errc::io_error);
        }

        if (m_backlog)
        {
            const auto& content = m_backlog->buffer();
            out.write(reinterpret_cast<const char*>(content.data()), content.size());
        }

        if (!out)
        {
            return std::make_error_code(std::errc::io_error);
        }

        return {};
    }

    std::unique_ptr<Backend> m_backend;
    std::unique_ptr<Backlog> m_backlog;
    std::unique_ptr<spdlog::formatter> m_formatter;
};

}  // namespace Log
}  // namespace Netloc

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright 2011-2019 ANSSI. All Rights Reserved.
//
// Author(s): Jean Gautier (ANSSI)
//
#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "Log/Logger.h"
#include "Log/Sink/MemorySink.h"

namespace Netloc {

namespace Test {

//
// Install a default logger whose output is kept in memory, the previous default logger is restored on destruction
//

class UnitTestHelper
{
public:
    using MemorySinkT = Log::MemorySink<std::string, std::mutex>;

    static constexpr size_t kLogCapacity = 64 * 1024;

    UnitTestHelper();
    ~UnitTestHelper();

    const Netloc::Logger& logger() const { return *m_logger; }

    // Formatted log lines received so far
    std::string Logs() const;

    // Empty directory removed with the helper
    std::filesystem::path CreateTemporaryDirectory(std::wstring_view prefix);

private:
    std::shared_ptr<Netloc::Logger> m_logger;
    std::shared_ptr<Netloc::Logger> m_previousLogger;
    std::shared_ptr<MemorySinkT> m_sink;
    std::vector<std::filesystem::path> m_temporaryDirectories;
};

}  // namespace Test

}  // namespace Netloc

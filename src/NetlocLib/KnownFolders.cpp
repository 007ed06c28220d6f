//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "KnownFolders.h"

#ifdef _WIN32
#    include <windows.h>
#    include <knownfolders.h>
#    include <shlobj.h>
#else
#    include <boost/nowide/cstdlib.hpp>
#endif

#include "Log/Log.h"

namespace fs = std::filesystem;

namespace Netloc {
namespace KnownFolders {

#ifdef _WIN32

Result<fs::path> NetworkShortcuts()
{
    PWSTR path = nullptr;
    HRESULT hr = SHGetKnownFolderPath(FOLDERID_NetHood, KF_FLAG_DEFAULT, nullptr, &path);
    if (FAILED(hr))
    {
        ::CoTaskMemFree(path);
        Log::Debug("Failed to get known folder 'NetHood' [{}]", SystemError(hr));
        return SystemError(hr);
    }

    fs::path netHood(path);
    ::CoTaskMemFree(path);
    return netHood;
}

#else

Result<fs::path> NetworkShortcuts()
{
    const char* appData = boost::nowide::getenv("APPDATA");
    if (appData == nullptr || *appData == '\0')
    {
        Log::Debug("Failed to get network shortcuts folder: 'APPDATA' is not defined");
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    return fs::path(appData) / "Microsoft" / "Windows" / "Network Shortcuts";
}

#endif

}  // namespace KnownFolders
}  // namespace Netloc

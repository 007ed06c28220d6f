//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2011-2019 ANSSI. All Rights Reserved.
//
// Author(s): Jean Gautier (ANSSI)
//
// Netloc.cpp : Defines the entry point for the console application.
//

#include <cstdio>
#include <string>
#include <vector>

#ifdef _WIN32
#    include <windows.h>
#    include <objbase.h>
#endif

#include <boost/scope_exit.hpp>

#include "NetworkLocations.h"
#include "Text/Iconv.h"

using namespace Netloc;
using namespace Netloc::Command;

namespace {

int Main(int argc, const wchar_t* argv[])
{
#ifdef _WIN32
    // The shell link resolver needs an apartment threaded COM
    HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
    if (FAILED(hr))
    {
        std::fwprintf(stderr, L"Failed to initialize COM library [0x%lx]\n", static_cast<unsigned long>(hr));
        return hr;
    }

    BOOST_SCOPE_EXIT(void) { CoUninitialize(); }
    BOOST_SCOPE_EXIT_END;
#endif

    return UtilitiesMain::WMain<NetworkLocations::Main>(argc, argv);
}

}  // namespace

#ifdef _WIN32

int wmain(int argc, const wchar_t* argv[])
{
    return ::Main(argc, argv);
}

#else

int main(int argc, char* argv[])
{
    std::vector<std::wstring> arguments;
    arguments.reserve(argc);
    for (int i = 0; i < argc; ++i)
    {
        arguments.push_back(Utf8ToUtf16(argv[i]));
    }

    std::vector<const wchar_t*> wargv;
    wargv.reserve(argc);
    for (const auto& argument : arguments)
    {
        wargv.push_back(argument.c_str());
    }

    return ::Main(argc, wargv.data());
}

#endif

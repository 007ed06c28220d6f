//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "ComShellLinkResolver.h"

#include <memory>

#include <boost/scope_exit.hpp>

#include "Log/Log.h"

namespace fs = std::filesystem;

namespace Netloc {

Result<void> ComShellLinkResolver::Open(const fs::path& container)
{
    if (m_folder && m_container == container)
    {
        return Success();
    }

    m_folder.Release();

    CComPtr<IShellFolder> desktop;
    HRESULT hr = SHGetDesktopFolder(&desktop);
    if (FAILED(hr))
    {
        Log::Debug("Failed to get shell desktop folder [{}]", SystemError(hr));
        return SystemError(hr);
    }

    std::wstring displayName = container.wstring();
    PIDLIST_RELATIVE pidl = nullptr;
    hr = desktop->ParseDisplayName(nullptr, nullptr, displayName.data(), nullptr, &pidl, nullptr);
    if (FAILED(hr))
    {
        Log::Debug(L"Failed to parse shell display name '{}' [{}]", displayName, SystemError(hr));
        return SystemError(hr);
    }

    BOOST_SCOPE_EXIT(&pidl)
    {
        ::CoTaskMemFree(pidl);
    }
    BOOST_SCOPE_EXIT_END;

    CComPtr<IShellFolder> folder;
    hr = desktop->BindToObject(pidl, nullptr, IID_PPV_ARGS(&folder));
    if (FAILED(hr))
    {
        Log::Debug(L"Failed to bind shell folder '{}' [{}]", displayName, SystemError(hr));
        return SystemError(hr);
    }

    m_container = container;
    m_folder = folder;
    return Success();
}

Result<std::optional<std::wstring>>
ComShellLinkResolver::ResolveLinkTarget(const fs::path& container, std::wstring_view entryName)
{
    auto opened = Open(container);
    if (!opened)
    {
        return opened.error();
    }

    std::wstring name(entryName);
    PIDLIST_RELATIVE pidl = nullptr;
    HRESULT hr = m_folder->ParseDisplayName(nullptr, nullptr, name.data(), nullptr, &pidl, nullptr);
    if (hr == HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND) || hr == HRESULT_FROM_WIN32(ERROR_PATH_NOT_FOUND))
    {
        return std::optional<std::wstring>();
    }

    if (FAILED(hr))
    {
        Log::Debug(L"Failed to parse shell item '{}' [{}]", name, SystemError(hr));
        return SystemError(hr);
    }

    BOOST_SCOPE_EXIT(&pidl)
    {
        ::CoTaskMemFree(pidl);
    }
    BOOST_SCOPE_EXIT_END;

    SFGAOF attributes = SFGAO_LINK;
    hr = m_folder->GetAttributesOf(1, const_cast<PCUITEMID_CHILD_ARRAY>(&pidl), &attributes);
    if (FAILED(hr))
    {
        Log::Debug(L"Failed to get shell item attributes '{}' [{}]", name, SystemError(hr));
        return SystemError(hr);
    }

    if (!(attributes & SFGAO_LINK))
    {
        return std::optional<std::wstring>();
    }

    CComPtr<IShellLinkW> link;
    hr = m_folder->GetUIObjectOf(
        nullptr, 1, const_cast<PCUITEMID_CHILD_ARRAY>(&pidl), IID_IShellLinkW, nullptr, reinterpret_cast<void**>(&link));
    if (FAILED(hr))
    {
        Log::Debug(L"Failed to get shell link of '{}' [{}]", name, SystemError(hr));
        return SystemError(hr);
    }

    WCHAR path[MAX_PATH] = {0};
    hr = link->GetPath(path, MAX_PATH, nullptr, SLGP_UNCPRIORITY);
    if (hr == S_OK && path[0] != L'\0')
    {
        return std::optional<std::wstring>(path);
    }

    if (FAILED(hr))
    {
        Log::Debug(L"Failed to get shell link path of '{}' [{}]", name, SystemError(hr));
        return SystemError(hr);
    }

    // Network locations have no file system path, their target is only an id list
    PIDLIST_ABSOLUTE targetIdList = nullptr;
    hr = link->GetIDList(&targetIdList);
    if (FAILED(hr) || targetIdList == nullptr)
    {
        return std::optional<std::wstring>();
    }

    BOOST_SCOPE_EXIT(&targetIdList)
    {
        ::CoTaskMemFree(targetIdList);
    }
    BOOST_SCOPE_EXIT_END;

    PWSTR displayName = nullptr;
    hr = SHGetNameFromIDList(targetIdList, SIGDN_DESKTOPABSOLUTEPARSING, &displayName);
    if (FAILED(hr))
    {
        Log::Debug(L"Failed to get shell link target name of '{}' [{}]", name, SystemError(hr));
        return SystemError(hr);
    }

    std::wstring target(displayName);
    ::CoTaskMemFree(displayName);
    return std::optional<std::wstring>(std::move(target));
}

}  // namespace Netloc

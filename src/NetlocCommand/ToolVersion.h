//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2011-2019 ANSSI. All Rights Reserved.
//
// Author(s): Jean Gautier (ANSSI)
//

#pragma once

// NETLOC_VERSION_STRING is provided by the build from the project version
#ifndef NETLOC_VERSION_STRING
#    define NETLOC_VERSION_STRING "0.0.0"
#endif

#define NETLOC_WIDEN_(x) L##x
#define NETLOC_WIDEN(x) NETLOC_WIDEN_(x)
#define NETLOC_VERSION_STRINGW NETLOC_WIDEN(NETLOC_VERSION_STRING)

#define NETLOC_PRODUCTNAME_STRINGW L"Netloc"

extern const char* kNetlocVersionString;
extern const wchar_t* kNetlocVersionStringW;
extern const wchar_t* kProductNameStringW;

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2011-2019 ANSSI. All Rights Reserved.
//
// Author(s): fabienfl
//

#include "ToolVersion.h"

const char* kNetlocVersionString = NETLOC_VERSION_STRING;
const wchar_t* kNetlocVersionStringW = NETLOC_VERSION_STRINGW;
const wchar_t* kProductNameStringW = NETLOC_PRODUCTNAME_STRINGW;

//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <filesystem>

#include "Utils/Result.h"

namespace Netloc {
namespace KnownFolders {

// Per user container of the network location shortcuts ('Network Shortcuts', FOLDERID_NetHood)
Result<std::filesystem::path> NetworkShortcuts();

}  // namespace KnownFolders
}  // namespace Netloc

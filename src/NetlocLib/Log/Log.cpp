//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include "Log/Log.h"

namespace Netloc {
namespace Log {

std::shared_ptr<Logger>& DefaultLogger()
{
    static std::shared_ptr<Logger> logger;
    return logger;
}

void SetDefaultLogger(std::shared_ptr<Logger> instance)
{
    DefaultLogger() = std::move(instance);
}

}  // namespace Log
}  // namespace Netloc

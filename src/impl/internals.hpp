/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_IMPL_INTERNALS_H
#define NETHERNET_IMPL_INTERNALS_H

#include "common.hpp"

// Disable warnings before including plog
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4244)
#endif

#include "plog/Log.h"

#ifdef _MSC_VER
#pragma warning(pop)
#endif

#endif

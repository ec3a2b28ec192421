/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_UTILS_H
#define NETHERNET_UTILS_H

#include "rtc/utils.hpp"

namespace nethernet {

// Pimpl holder and thread-safe callback from libdatachannel
using rtc::CheshireCat;
using rtc::synchronized_callback;

} // namespace nethernet

#endif

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

// C API
#include "nethernet.h"

// C++ API
#include "common.hpp"
#include "global.hpp"
#include "errors.hpp"
#include "signal.hpp"
#include "peertransport.hpp"
#include "signalingchannel.hpp"
#include "connection.hpp"
#include "configuration.hpp"
#include "server.hpp"
#include "rtctransport.hpp"
#include "websocketsignal.hpp"

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_GLOBAL_H
#define NETHERNET_GLOBAL_H

#include "common.hpp"

#include <iostream>

namespace nethernet {

enum class LogLevel { // Don't change, it must match plog severity
	None = 0,
	Fatal = 1,
	Error = 2,
	Warning = 3,
	Info = 4,
	Debug = 5,
	Verbose = 6
};

typedef std::function<void(LogLevel level, string message)> LogCallback;

// NULL callback on the first call will log to stdout
NETHERNET_CPP_EXPORT void InitLogger(LogLevel level, LogCallback callback = nullptr);

NETHERNET_CPP_EXPORT std::ostream &operator<<(std::ostream &out, LogLevel level);

} // namespace nethernet

#endif

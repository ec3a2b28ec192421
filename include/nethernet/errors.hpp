/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_ERRORS_H
#define NETHERNET_ERRORS_H

#include "common.hpp"

#include <stdexcept>

namespace nethernet {

// 缺少信令凭据等配置问题，仅拒绝当前 offer
class NETHERNET_CPP_EXPORT ConfigurationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// offer 无法使用或未能生成 answer，仅终止该连接的协商
class NETHERNET_CPP_EXPORT NegotiationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// 远端候选无法应用到传输层，总是在本地记录后跳过
class NETHERNET_CPP_EXPORT TransportApplyError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace nethernet

#endif

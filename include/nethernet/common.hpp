/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_COMMON_H
#define NETHERNET_COMMON_H

#ifdef NETHERNET_STATIC
#define NETHERNET_CPP_EXPORT
#else // dynamic library
#ifdef _WIN32
#ifdef NETHERNET_EXPORTS
#define NETHERNET_CPP_EXPORT __declspec(dllexport) // building the library
#else
#define NETHERNET_CPP_EXPORT __declspec(dllimport) // using the library
#endif
#else // not WIN32
#define NETHERNET_CPP_EXPORT
#endif
#endif

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nethernet {

using std::byte;
using std::nullopt;
using std::optional;
using std::shared_ptr;
using std::string;
using std::string_view;
using std::unique_ptr;
using std::weak_ptr;

using binary = std::vector<byte>;

// 对端在每条信令中携带的连接标识
using ConnectionId = uint64_t;
// 信令网络上主机的标识
using NetworkId = uint64_t;

// 数据通道标签，远端按标签区分可靠与不可靠通道
const string ReliableChannelLabel = "ReliableDataChannel";
const string UnreliableChannelLabel = "UnreliableDataChannel";

// 远端候选统一使用的 media line 标识
const string CandidateMid = "0";

} // namespace nethernet

#endif

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_IMPL_UTILS_H
#define NETHERNET_IMPL_UTILS_H

#include "common.hpp"

#include <random>

namespace nethernet::impl::utils {

// Seeded from std::random_device once per thread
std::mt19937_64 &random_engine();

// Uniform over the whole 64-bit range
uint64_t random_uint64();

// Parses a base-10 unsigned 64-bit integer, nullopt on any trailing garbage
optional<uint64_t> parse_uint64(string_view str);

} // namespace nethernet::impl::utils

#endif

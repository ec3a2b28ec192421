/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "utils.hpp"

#include <charconv>
#include <limits>

namespace nethernet::impl::utils {

std::mt19937_64 &random_engine() {
	static thread_local std::mt19937_64 engine = [] {
		std::random_device device;
		std::seed_seq seed{device(), device(), device(), device()};
		return std::mt19937_64(seed);
	}();
	return engine;
}

uint64_t random_uint64() {
	std::uniform_int_distribution<uint64_t> distribution(0, std::numeric_limits<uint64_t>::max());
	return distribution(random_engine());
}

optional<uint64_t> parse_uint64(string_view str) {
	if (str.empty())
		return nullopt;

	uint64_t value = 0;
	auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
	if (ec != std::errc() || ptr != str.data() + str.size())
		return nullopt;

	return value;
}

} // namespace nethernet::impl::utils

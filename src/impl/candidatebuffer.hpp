/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_IMPL_CANDIDATE_BUFFER_H
#define NETHERNET_IMPL_CANDIDATE_BUFFER_H

#include "common.hpp"

#include <unordered_map>
#include <vector>

namespace nethernet::impl {

// 尚未完成 offer 协商的连接所收到的远端候选，按到达顺序保存
// Not synchronized, the owner serializes access
class CandidateBuffer final {
public:
	// Appends, creating the bucket if absent
	void bufferCandidate(ConnectionId id, string candidate);

	// Creates an empty bucket if absent, keeps an existing one
	void open(ConnectionId id);
	bool isPending(ConnectionId id) const;

	// Takes the buffered candidates and leaves the bucket open
	std::vector<string> drain(ConnectionId id);
	// Takes the buffered candidates and deletes the bucket
	std::vector<string> drainAndRemove(ConnectionId id);

	bool remove(ConnectionId id);
	void clear();

	size_t size() const;
	size_t candidateCount(ConnectionId id) const;

private:
	std::unordered_map<ConnectionId, std::vector<string>> mPending;
};

} // namespace nethernet::impl

#endif

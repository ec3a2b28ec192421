/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "candidatebuffer.hpp"

#include <utility>

namespace nethernet::impl {

void CandidateBuffer::bufferCandidate(ConnectionId id, string candidate) {
	mPending[id].push_back(std::move(candidate));
}

void CandidateBuffer::open(ConnectionId id) { mPending.try_emplace(id); }

bool CandidateBuffer::isPending(ConnectionId id) const {
	return mPending.find(id) != mPending.end();
}

std::vector<string> CandidateBuffer::drain(ConnectionId id) {
	if (auto it = mPending.find(id); it != mPending.end())
		return std::exchange(it->second, {});
	else
		return {};
}

std::vector<string> CandidateBuffer::drainAndRemove(ConnectionId id) {
	auto it = mPending.find(id);
	if (it == mPending.end())
		return {};

	auto candidates = std::move(it->second);
	mPending.erase(it);
	return candidates;
}

bool CandidateBuffer::remove(ConnectionId id) { return mPending.erase(id) != 0; }

void CandidateBuffer::clear() { mPending.clear(); }

size_t CandidateBuffer::size() const { return mPending.size(); }

size_t CandidateBuffer::candidateCount(ConnectionId id) const {
	auto it = mPending.find(id);
	return it != mPending.end() ? it->second.size() : 0;
}

} // namespace nethernet::impl

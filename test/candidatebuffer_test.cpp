/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "impl/candidatebuffer.hpp"

#include <gtest/gtest.h>

using nethernet::impl::CandidateBuffer;

TEST(CandidateBufferTest, KeepsArrivalOrderPerConnection) {
	CandidateBuffer buffer;
	buffer.bufferCandidate(7, "a");
	buffer.bufferCandidate(8, "x");
	buffer.bufferCandidate(7, "b");

	EXPECT_TRUE(buffer.isPending(7));
	EXPECT_EQ(buffer.size(), 2u);
	EXPECT_EQ(buffer.candidateCount(7), 2u);

	auto drained = buffer.drainAndRemove(7);
	ASSERT_EQ(drained.size(), 2u);
	EXPECT_EQ(drained[0], "a");
	EXPECT_EQ(drained[1], "b");
	EXPECT_FALSE(buffer.isPending(7));
	EXPECT_TRUE(buffer.isPending(8));
}

TEST(CandidateBufferTest, DrainLeavesBucketOpen) {
	CandidateBuffer buffer;
	buffer.bufferCandidate(1, "a");

	EXPECT_EQ(buffer.drain(1).size(), 1u);
	EXPECT_TRUE(buffer.isPending(1));
	EXPECT_EQ(buffer.candidateCount(1), 0u);

	buffer.bufferCandidate(1, "b");
	auto drained = buffer.drain(1);
	ASSERT_EQ(drained.size(), 1u);
	EXPECT_EQ(drained[0], "b");
}

TEST(CandidateBufferTest, OpenKeepsExistingCandidates) {
	CandidateBuffer buffer;
	buffer.open(3);
	EXPECT_TRUE(buffer.isPending(3));
	EXPECT_EQ(buffer.candidateCount(3), 0u);

	buffer.bufferCandidate(3, "a");
	buffer.open(3);
	EXPECT_EQ(buffer.candidateCount(3), 1u);
}

TEST(CandidateBufferTest, UnknownConnectionIsEmpty) {
	CandidateBuffer buffer;
	EXPECT_FALSE(buffer.isPending(42));
	EXPECT_TRUE(buffer.drain(42).empty());
	EXPECT_TRUE(buffer.drainAndRemove(42).empty());
	EXPECT_FALSE(buffer.remove(42));
	EXPECT_EQ(buffer.candidateCount(42), 0u);
	EXPECT_EQ(buffer.size(), 0u);
}

TEST(CandidateBufferTest, RemoveAndClear) {
	CandidateBuffer buffer;
	buffer.bufferCandidate(1, "a");
	buffer.bufferCandidate(2, "b");

	EXPECT_TRUE(buffer.remove(1));
	EXPECT_FALSE(buffer.isPending(1));

	buffer.clear();
	EXPECT_EQ(buffer.size(), 0u);
	EXPECT_FALSE(buffer.isPending(2));
}

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_CONNECTION_H
#define NETHERNET_CONNECTION_H

#include "common.hpp"
#include "peertransport.hpp"

#include <atomic>
#include <iostream>
#include <queue>

namespace nethernet {

// 一个对端连接：一个传输实例加上可靠与不可靠两个数据通道
class NETHERNET_CPP_EXPORT Connection final : public std::enable_shared_from_this<Connection> {
public:
	enum class State : int {
		Negotiating = 0, // offer 已收到，等待连通
		Established = 1, // 传输层已连通
		Closed = 2       // 终止状态
	};

	// Largest payload carried by one segment on the reliable channel
	static constexpr size_t MaxSegmentSize = 10000;
	// The remaining-segments header is one byte
	static constexpr size_t MaxSegmentCount = 256;

	Connection(ConnectionId id, shared_ptr<PeerTransport> transport);
	~Connection();

	ConnectionId id() const;
	State state() const;
	shared_ptr<PeerTransport> transport() const;

	// Returns false if the connection is already in newState or Closed
	bool changeState(State newState);

	// A null argument leaves the corresponding channel unchanged
	void setChannels(shared_ptr<DataChannel> reliable, shared_ptr<DataChannel> unreliable = nullptr);
	shared_ptr<DataChannel> reliableChannel() const;
	shared_ptr<DataChannel> unreliableChannel() const;

	// Returns the number of payload bytes sent, 0 if queued or closed
	size_t send(binary data);
	void close();
	bool isClosed() const;

	void onMessage(std::function<void(binary message)> callback);

private:
	void incoming(binary message);
	void flushQueue();
	size_t sendSegments(const shared_ptr<DataChannel> &channel, const binary &data);

	const ConnectionId mId;
	const shared_ptr<PeerTransport> mTransport;

	std::atomic<State> mState = State::Negotiating;
	std::atomic<bool> mIsClosed = false;

	mutable std::mutex mChannelsMutex;
	shared_ptr<DataChannel> mReliable;
	shared_ptr<DataChannel> mUnreliable;

	std::mutex mSendMutex;
	std::queue<binary> mSendQueue;

	std::mutex mRecvMutex;
	binary mRecvBuffer;
	size_t mPromisedSegments = 0;

	synchronized_callback<binary> mMessageCallback;
};

NETHERNET_CPP_EXPORT std::ostream &operator<<(std::ostream &out, Connection::State state);

} // namespace nethernet

#endif

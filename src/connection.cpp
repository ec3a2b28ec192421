/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "connection.hpp"
#include "common.hpp"

#include "impl/internals.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace nethernet {

Connection::Connection(ConnectionId id, shared_ptr<PeerTransport> transport)
    : mId(id), mTransport(std::move(transport)) {
	if (!mTransport)
		throw std::invalid_argument("Connection requires a transport");

	PLOG_VERBOSE << "Creating Connection " << mId;
}

Connection::~Connection() {
	PLOG_VERBOSE << "Destroying Connection " << mId;
	try {
		close();
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

ConnectionId Connection::id() const { return mId; }

Connection::State Connection::state() const { return mState.load(); }

shared_ptr<PeerTransport> Connection::transport() const { return mTransport; }

// 函数 changeState：改变连接状态
// 1. Closed 为终止状态，处于 Closed 或目标状态时返回 false
bool Connection::changeState(State newState) {
	State current;
	do {
		current = mState.load();
		if (current == State::Closed)
			return false;
		if (current == newState)
			return false;

	} while (!mState.compare_exchange_weak(current, newState));

	PLOG_VERBOSE << "Connection " << mId << " changed state to " << newState;
	return true;
}

// 函数 setChannels：按标签绑定数据通道
// 1. 可靠通道订阅消息，并在打开时发送排队的数据
void Connection::setChannels(shared_ptr<DataChannel> reliable, shared_ptr<DataChannel> unreliable) {
	if (reliable) {
		{
			std::lock_guard lock(mChannelsMutex);
			mReliable = reliable;
		}

		std::weak_ptr<Connection> weak_this = weak_from_this();
		reliable->onMessage([weak_this](binary message) {
			if (auto shared_this = weak_this.lock())
				shared_this->incoming(std::move(message));
		});
		reliable->onOpen([weak_this]() {
			if (auto shared_this = weak_this.lock())
				shared_this->flushQueue();
		});

		// The channel may have opened before the callback was set
		if (reliable->isOpen())
			flushQueue();
	}

	if (unreliable) {
		std::lock_guard lock(mChannelsMutex);
		mUnreliable = std::move(unreliable);
	}
}

shared_ptr<DataChannel> Connection::reliableChannel() const {
	std::lock_guard lock(mChannelsMutex);
	return mReliable;
}

shared_ptr<DataChannel> Connection::unreliableChannel() const {
	std::lock_guard lock(mChannelsMutex);
	return mUnreliable;
}

// 函数 send：在可靠通道上分段发送
// 1. 通道未绑定或尚未打开时排队
// 2. 已关闭时丢弃
size_t Connection::send(binary data) {
	if (data.size() > MaxSegmentSize * MaxSegmentCount)
		throw std::invalid_argument("Message too large to segment");

	if (mIsClosed)
		return 0;

	std::lock_guard lock(mSendMutex);
	auto channel = reliableChannel();
	if (!channel || !channel->isOpen()) {
		if (channel && channel->isClosed()) {
			PLOG_DEBUG << "Dropping message on closed connection " << mId;
			return 0;
		}

		mSendQueue.push(std::move(data));
		return 0;
	}

	// Queued messages go first
	while (!mSendQueue.empty()) {
		binary queued = std::move(mSendQueue.front());
		mSendQueue.pop();
		sendSegments(channel, queued);
	}

	return sendSegments(channel, data);
}

void Connection::close() {
	if (mIsClosed.exchange(true))
		return;

	PLOG_VERBOSE << "Closing Connection " << mId;

	shared_ptr<DataChannel> reliable, unreliable;
	{
		std::lock_guard lock(mChannelsMutex);
		reliable = std::move(mReliable);
		unreliable = std::move(mUnreliable);
	}

	if (reliable)
		reliable->close();
	if (unreliable)
		unreliable->close();

	mTransport->close();

	std::lock_guard lock(mSendMutex);
	mSendQueue = {};
}

bool Connection::isClosed() const { return mIsClosed; }

void Connection::onMessage(std::function<void(binary message)> callback) {
	mMessageCallback = callback;
}

// 函数 incoming：重组分段消息
// 1. 首字节为之后还剩的分段数
// 2. 分段数不连续时丢弃已缓存的数据
void Connection::incoming(binary message) {
	if (message.size() < 2)
		return;

	binary complete;
	{
		std::lock_guard lock(mRecvMutex);
		const auto remaining = std::to_integer<size_t>(message[0]);
		if (mPromisedSegments > 0 && mPromisedSegments - 1 != remaining) {
			PLOG_WARNING << "Segment count mismatch on connection " << mId << ", expected "
			             << mPromisedSegments - 1 << ", got " << remaining;
			mPromisedSegments = 0;
			mRecvBuffer.clear();
			return;
		}

		mRecvBuffer.insert(mRecvBuffer.end(), message.begin() + 1, message.end());
		mPromisedSegments = remaining;
		if (mPromisedSegments > 0)
			return;

		complete = std::exchange(mRecvBuffer, {});
	}

	mMessageCallback(std::move(complete));
}

void Connection::flushQueue() {
	std::lock_guard lock(mSendMutex);
	auto channel = reliableChannel();
	if (!channel || !channel->isOpen())
		return;

	while (!mSendQueue.empty()) {
		binary data = std::move(mSendQueue.front());
		mSendQueue.pop();
		sendSegments(channel, data);
	}
}

size_t Connection::sendSegments(const shared_ptr<DataChannel> &channel, const binary &data) {
	size_t segments = (data.size() + MaxSegmentSize - 1) / MaxSegmentSize;
	if (segments > MaxSegmentCount)
		throw std::invalid_argument("Message too large to segment");

	size_t sent = 0;
	for (size_t offset = 0; offset < data.size(); offset += MaxSegmentSize) {
		--segments;
		const size_t end = std::min(offset + MaxSegmentSize, data.size());

		binary segment;
		segment.reserve(1 + end - offset);
		segment.push_back(static_cast<byte>(segments));
		segment.insert(segment.end(), data.begin() + offset, data.begin() + end);

		if (!channel->send(std::move(segment)))
			PLOG_DEBUG << "Segment buffered on connection " << mId;

		sent += end - offset;
	}

	return sent;
}

std::ostream &operator<<(std::ostream &out, Connection::State state) {
	using State = Connection::State;
	const char *str;
	switch (state) {
	case State::Negotiating:
		str = "negotiating";
		break;
	case State::Established:
		str = "established";
		break;
	case State::Closed:
		str = "closed";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}

} // namespace nethernet

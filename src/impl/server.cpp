/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "server.hpp"
#include "errors.hpp"
#include "internals.hpp"
#include "rtctransport.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace nethernet::impl {

// 函数 Server 构造函数
// 1. 未配置的网络标识与连接标识取 64 位随机值
Server::Server(shared_ptr<SignalingChannel> signaling, Configuration config)
    : networkId(config.networkId.value_or(utils::random_uint64())),
      connectionId(config.connectionId.value_or(utils::random_uint64())),
      mSignaling(std::move(signaling)),
      mTransportFactory(config.transportFactory ? std::move(config.transportFactory)
                                                : TransportFactory(&RtcPeerTransport::Create)),
      mRetiredLimit(config.retiredConnectionsLimit),
      mPendingLimit(config.pendingConnectionsLimit) {
	PLOG_VERBOSE << "Creating Server";

	if (!mSignaling)
		throw std::invalid_argument("Server requires a signaling channel");

	PLOG_DEBUG << "Server networkId=" << networkId << ", connectionId=" << connectionId;
}

Server::~Server() { PLOG_VERBOSE << "Destroying Server"; }

// 函数 listen：连接信令通道后订阅信令
// 1. 连接失败直接抛给调用者，此时不会处理任何信令
void Server::listen() {
	PLOG_VERBOSE << "Connecting signaling channel";
	mSignaling->connect();

	std::weak_ptr<Server> weak_this = shared_from_this();
	mSignaling->onSignal([weak_this](SignalStructure signal) {
		if (auto shared_this = weak_this.lock())
			shared_this->handleSignal(signal);
	});

	PLOG_INFO << "Listening for connections, networkId=" << networkId;
}

// 函数 close：关闭所有已注册连接并清空状态
// 1. 对注册表快照逐个走终止流程，单个失败不影响其余连接
// 2. 快照中仍留在注册表的连接直接注销
// 3. 重复直到在锁内看到注册表为空，再清空候选缓存
void Server::close() {
	while (true) {
		std::vector<shared_ptr<Connection>> connections;
		{
			std::lock_guard lock(mMutex);
			connections = mConnections.values();
			if (connections.empty()) {
				mPendingCandidates.clear();
				mUnclaimedOrder.clear();
				break;
			}
		}

		PLOG_INFO << "Closing " << connections.size() << " connections";

		for (auto &connection : connections)
			processStateChange(connection, TransportState::Closed);

		// 2. 另一线程正在关闭的连接也在此注销，保证循环结束
		std::lock_guard lock(mMutex);
		for (const auto &connection : connections) {
			const ConnectionId id = connection->id();
			if (mConnections.lookup(id) == connection) {
				mConnections.unregisterConnection(id);
				mPendingCandidates.remove(id);
			}
		}
	}
}

// 函数 handleSignal：按类型分发一条入站信令
void Server::handleSignal(const SignalStructure &signal) {
	switch (signal.type) {
	case SignalType::ConnectRequest: {
		shared_ptr<Connection> connection;
		try {
			negotiate(signal, connection);
		} catch (const ConfigurationError &e) {
			PLOG_ERROR << "Rejected offer for connection " << signal.connectionId << ": "
			           << e.what();
		} catch (const NegotiationError &e) {
			PLOG_ERROR << "Negotiation failed for connection " << signal.connectionId << ": "
			           << e.what();
			// A failed negotiation counts as an immediate close
			if (connection)
				processStateChange(std::move(connection), TransportState::Failed);
		} catch (const std::exception &e) {
			PLOG_ERROR << "Transport error while negotiating connection " << signal.connectionId
			           << ": " << e.what();
			if (connection)
				processStateChange(std::move(connection), TransportState::Failed);
		}
		break;
	}
	case SignalType::CandidateAdd:
		handleCandidate(signal);
		break;

	default:
		PLOG_DEBUG << "Received signal for unknown type: " << signal;
		break;
	}
}

void Server::handleOffer(const SignalStructure &signal) {
	shared_ptr<Connection> connection;
	negotiate(signal, connection);
}

// 函数 negotiate：处理远端 offer
// 1. 检查信令凭据
// 2. 创建传输并注册连接，打开候选缓存
// 3. 绑定传输回调
// 4. 设置远端 offer 并取回本地 answer
// 5. 发送 answer 后按到达顺序应用缓存的候选
void Server::negotiate(const SignalStructure &signal, shared_ptr<Connection> &connection) {
	// 1. 没有凭据时不创建任何状态，也不发送任何信令
	auto credentials = mSignaling->credentials();
	if (!credentials)
		throw ConfigurationError("No credentials set");

	const ConnectionId id = signal.connectionId;
	PLOG_DEBUG << "Received offer for connection " << id;

	// 2. 创建传输
	TransportConfiguration config;
	config.iceServers = std::move(*credentials);

	shared_ptr<PeerTransport> transport;
	try {
		transport = mTransportFactory(config);
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
		throw NegotiationError("Transport creation failed");
	}
	if (!transport)
		throw NegotiationError("Transport creation failed");

	connection = std::make_shared<Connection>(id, transport);

	// 2.1 协商完成前就注册，协商期间到达的候选需要能找到连接
	shared_ptr<Connection> replaced;
	{
		std::lock_guard lock(mMutex);
		if (mRetired.erase(id) != 0)
			mRetiredOrder.erase(std::remove(mRetiredOrder.begin(), mRetiredOrder.end(), id),
			                    mRetiredOrder.end());

		replaced = mConnections.registerConnection(id, connection);
		mPendingCandidates.open(id); // keeps candidates buffered before the offer
		claim(id);
	}

	if (replaced) {
		PLOG_WARNING << "New offer replaces live connection " << id;
		processStateChange(std::move(replaced), TransportState::Closed);
	}

	// 3. 绑定回调
	bindTransport(connection, signal.networkId);

	// 4. 设置远端描述，offer 无法解析时抛出 NegotiationError
	transport->setRemoteDescription(signal.data, "offer");

	auto description = transport->localDescription();
	if (!description || description->type != "answer" || description->sdp.empty())
		throw NegotiationError("Failed to generate answer");

	if (!writeSignal(
	        SignalStructure(SignalType::ConnectResponse, id, description->sdp, signal.networkId)))
		throw NegotiationError("Failed to send answer");

	// 5. 应用缓存的候选，然后删除缓存
	drainPendingCandidates(connection);

	PLOG_DEBUG << "Answered offer for connection " << id;
}

// 函数 handleCandidate：处理远端候选
// 1. 缓存存在时只追加，不触碰传输，保证与排空过程的先后顺序
// 2. 已注册的连接立即应用
// 3. 已关闭的连接直接丢弃，从未出现的连接懒创建缓存，数量有上限
void Server::handleCandidate(const SignalStructure &signal) {
	const ConnectionId id = signal.connectionId;

	shared_ptr<Connection> connection;
	{
		std::lock_guard lock(mMutex);
		if (mPendingCandidates.isPending(id)) {
			PLOG_VERBOSE << "Buffering candidate for connection " << id;
			mPendingCandidates.bufferCandidate(id, signal.data);
			return;
		}

		connection = mConnections.lookup(id);
		if (!connection) {
			if (mRetired.find(id) != mRetired.end()) {
				PLOG_DEBUG << "Received candidate for closed connection " << id;
				return;
			}

			bufferUnclaimed(id, signal.data);
			return;
		}
	}

	applyCandidate(connection, signal.data);
}

// 函数 processStateChange：根据传输层状态驱动连接生命周期
// 1. connected 只通知一次打开
// 2. 终止状态依次：通知关闭、释放连接资源、注销、删除残留缓存
void Server::processStateChange(shared_ptr<Connection> connection, TransportState state) {
	const ConnectionId id = connection->id();
	PLOG_DEBUG << "Connection " << id << " transport state changed to " << state;

	if (state == TransportState::Connected) {
		if (connection->changeState(Connection::State::Established))
			triggerOpenConnection(std::move(connection));
		return;
	}

	if (!is_terminal(state))
		return;

	// Transports may report several terminal states
	if (!connection->changeState(Connection::State::Closed)) {
		PLOG_VERBOSE << "Ignoring " << state << " for already closed connection " << id;
		return;
	}

	triggerCloseConnection(id, to_string(state));

	try {
		connection->close();
	} catch (const std::exception &e) {
		PLOG_WARNING << "Failed to close connection " << id << ": " << e.what();
	}

	std::lock_guard lock(mMutex);
	// The id may already belong to a newer negotiation
	if (mConnections.lookup(id) != connection)
		return;

	mConnections.unregisterConnection(id);
	auto residual = mPendingCandidates.drainAndRemove(id);
	if (!residual.empty())
		PLOG_DEBUG << "Dropped " << residual.size() << " pending candidates for connection " << id;

	retire(id);
}

bool Server::closeConnection(ConnectionId id) {
	auto connection = getConnection(id);
	if (!connection)
		return false;

	processStateChange(std::move(connection), TransportState::Closed);
	return true;
}

shared_ptr<Connection> Server::getConnection(ConnectionId id) const {
	std::lock_guard lock(mMutex);
	return mConnections.lookup(id);
}

bool Server::hasPendingCandidates(ConnectionId id) const {
	std::lock_guard lock(mMutex);
	return mPendingCandidates.isPending(id);
}

size_t Server::connectionCount() const {
	std::lock_guard lock(mMutex);
	return mConnections.size();
}

size_t Server::pendingCount() const {
	std::lock_guard lock(mMutex);
	return mPendingCandidates.size();
}

void Server::bindTransport(shared_ptr<Connection> connection, NetworkId remoteNetworkId) {
	const ConnectionId id = connection->id();
	auto transport = connection->transport();

	std::weak_ptr<Server> weak_this = shared_from_this();
	std::weak_ptr<Connection> weak_connection = connection;

	transport->onLocalCandidate([weak_this, id, remoteNetworkId](string candidate) {
		if (auto shared_this = weak_this.lock())
			shared_this->writeSignal(
			    SignalStructure(SignalType::CandidateAdd, id, std::move(candidate), remoteNetworkId));
	});

	transport->onDataChannel([weak_connection](shared_ptr<DataChannel> channel) {
		auto connection = weak_connection.lock();
		if (!connection || !channel)
			return;

		const string label = channel->label();
		if (label == ReliableChannelLabel)
			connection->setChannels(std::move(channel), nullptr);
		else if (label == UnreliableChannelLabel)
			connection->setChannels(nullptr, std::move(channel));
		else
			PLOG_DEBUG << "Ignoring data channel \"" << label << "\" on connection "
			           << connection->id();
	});

	transport->onStateChange([weak_this, weak_connection](TransportState state) {
		auto shared_this = weak_this.lock();
		auto connection = weak_connection.lock();
		if (shared_this && connection)
			shared_this->processStateChange(std::move(connection), state);
	});

	connection->onMessage([weak_this, id](binary message) {
		auto shared_this = weak_this.lock();
		if (!shared_this)
			return;

		try {
			shared_this->encapsulatedCallback(std::move(message), id);
		} catch (const std::exception &e) {
			PLOG_WARNING << "Uncaught exception in callback: " << e.what();
		}
	});
}

// 排空循环：只有在锁内发现缓存为空时才删除，之后到达的候选直接应用
void Server::drainPendingCandidates(const shared_ptr<Connection> &connection) {
	const ConnectionId id = connection->id();
	size_t count = 0;
	while (true) {
		std::vector<string> candidates;
		{
			std::lock_guard lock(mMutex);
			if (mConnections.lookup(id) != connection)
				break; // closed or replaced meanwhile

			candidates = mPendingCandidates.drain(id);
			if (candidates.empty()) {
				mPendingCandidates.remove(id);
				break;
			}
		}

		for (const auto &candidate : candidates)
			applyCandidate(connection, candidate);

		count += candidates.size();
	}

	if (count > 0)
		PLOG_DEBUG << "Applied " << count << " queued candidates for connection " << id;
}

void Server::applyCandidate(const shared_ptr<Connection> &connection, const string &candidate) {
	try {
		connection->transport()->addRemoteCandidate(candidate, CandidateMid);
	} catch (const TransportApplyError &e) {
		PLOG_DEBUG << "Failed to add remote candidate for connection " << connection->id()
		           << " (likely closed): " << e.what();
	}
}

bool Server::writeSignal(const SignalStructure &signal) {
	try {
		mSignaling->write(signal);
		return true;
	} catch (const std::runtime_error &e) {
		PLOG_WARNING << "Failed to write " << signal.type << " signal for connection "
		             << signal.connectionId << ": " << e.what();
		return false;
	}
}

void Server::retire(ConnectionId id) {
	if (mRetiredLimit == 0 || !mRetired.insert(id).second)
		return;

	mRetiredOrder.push_back(id);
	while (mRetiredOrder.size() > mRetiredLimit) {
		mRetired.erase(mRetiredOrder.front());
		mRetiredOrder.pop_front();
	}
}

// 未收到 offer 的缓存按创建顺序淘汰，最旧的先删除
void Server::bufferUnclaimed(ConnectionId id, string candidate) {
	if (mPendingLimit == 0) {
		PLOG_DEBUG << "Dropping candidate for unknown connection " << id;
		return;
	}

	PLOG_DEBUG << "Buffering candidate for unknown connection " << id;
	mPendingCandidates.bufferCandidate(id, std::move(candidate));
	mUnclaimedOrder.push_back(id);

	while (mUnclaimedOrder.size() > mPendingLimit) {
		const ConnectionId oldest = mUnclaimedOrder.front();
		mUnclaimedOrder.pop_front();
		PLOG_DEBUG << "Dropping " << mPendingCandidates.candidateCount(oldest)
		           << " candidates buffered for unknown connection " << oldest;
		mPendingCandidates.remove(oldest);
	}
}

void Server::claim(ConnectionId id) {
	mUnclaimedOrder.erase(std::remove(mUnclaimedOrder.begin(), mUnclaimedOrder.end(), id),
	                      mUnclaimedOrder.end());
}

void Server::triggerOpenConnection(shared_ptr<Connection> connection) {
	PLOG_INFO << "Connection " << connection->id() << " established";
	try {
		openConnectionCallback(std::move(connection));
	} catch (const std::exception &e) {
		PLOG_WARNING << "Uncaught exception in callback: " << e.what();
	}
}

void Server::triggerCloseConnection(ConnectionId id, string reason) {
	PLOG_INFO << "Connection " << id << " closed: " << reason;
	try {
		closeConnectionCallback(id, std::move(reason));
	} catch (const std::exception &e) {
		PLOG_WARNING << "Uncaught exception in callback: " << e.what();
	}
}

} // namespace nethernet::impl

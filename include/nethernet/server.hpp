/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_SERVER_H
#define NETHERNET_SERVER_H

#include "common.hpp"
#include "configuration.hpp"
#include "connection.hpp"
#include "signal.hpp"
#include "signalingchannel.hpp"

namespace nethernet {

namespace impl {

struct Server;

}

// 主机：接受远端 offer 并建立数据通道连接
class NETHERNET_CPP_EXPORT Server final : CheshireCat<impl::Server> {
public:
	Server(shared_ptr<SignalingChannel> signaling);
	Server(shared_ptr<SignalingChannel> signaling, Configuration config);
	~Server();

	NetworkId networkId() const;
	ConnectionId connectionId() const;

	// 连接信令通道并开始分发信令
	void listen();
	// 关闭所有连接并清空内部状态
	void close();

	// 信令入口，按类型分发，不抛出协商错误
	void handleSignal(const SignalStructure &signal);

	// Throws ConfigurationError or NegotiationError
	void handleOffer(const SignalStructure &signal);
	void handleCandidate(const SignalStructure &signal);

	// Returns false if no connection is registered under id
	bool closeConnection(ConnectionId id);

	shared_ptr<Connection> getConnection(ConnectionId id) const;
	bool hasPendingCandidates(ConnectionId id) const;
	size_t connectionCount() const;
	size_t pendingCount() const;

	void onOpenConnection(std::function<void(shared_ptr<Connection> connection)> callback);
	void onCloseConnection(std::function<void(ConnectionId id, string reason)> callback);
	void onEncapsulated(std::function<void(binary message, ConnectionId id)> callback);
};

} // namespace nethernet

#endif

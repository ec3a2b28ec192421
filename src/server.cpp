/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "server.hpp"
#include "common.hpp"

#include "impl/internals.hpp"
#include "impl/server.hpp"

namespace nethernet {

// 使用默认配置构造主机
Server::Server(shared_ptr<SignalingChannel> signaling)
    : Server(std::move(signaling), Configuration()) {}

Server::Server(shared_ptr<SignalingChannel> signaling, Configuration config)
    : CheshireCat<impl::Server>(std::move(signaling), std::move(config)) {}

// 析构时关闭所有连接
Server::~Server() {
	try {
		impl()->close();
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

NetworkId Server::networkId() const { return impl()->networkId; }

ConnectionId Server::connectionId() const { return impl()->connectionId; }

void Server::listen() { impl()->listen(); }

void Server::close() { impl()->close(); }

void Server::handleSignal(const SignalStructure &signal) { impl()->handleSignal(signal); }

void Server::handleOffer(const SignalStructure &signal) { impl()->handleOffer(signal); }

void Server::handleCandidate(const SignalStructure &signal) { impl()->handleCandidate(signal); }

bool Server::closeConnection(ConnectionId id) { return impl()->closeConnection(id); }

shared_ptr<Connection> Server::getConnection(ConnectionId id) const {
	return impl()->getConnection(id);
}

bool Server::hasPendingCandidates(ConnectionId id) const {
	return impl()->hasPendingCandidates(id);
}

size_t Server::connectionCount() const { return impl()->connectionCount(); }

size_t Server::pendingCount() const { return impl()->pendingCount(); }

void Server::onOpenConnection(std::function<void(shared_ptr<Connection> connection)> callback) {
	impl()->openConnectionCallback = callback;
}

void Server::onCloseConnection(std::function<void(ConnectionId id, string reason)> callback) {
	impl()->closeConnectionCallback = callback;
}

void Server::onEncapsulated(std::function<void(binary message, ConnectionId id)> callback) {
	impl()->encapsulatedCallback = callback;
}

} // namespace nethernet

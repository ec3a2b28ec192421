/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_IMPL_SERVER_H
#define NETHERNET_IMPL_SERVER_H

#include "candidatebuffer.hpp"
#include "common.hpp"
#include "configuration.hpp"
#include "connection.hpp"
#include "connectionregistry.hpp"
#include "signal.hpp"
#include "signalingchannel.hpp"

#include <deque>
#include <mutex>
#include <unordered_set>

namespace nethernet::impl {

struct Server final : public std::enable_shared_from_this<Server> {
	Server(shared_ptr<SignalingChannel> signaling, Configuration config);
	~Server();

	void listen();
	void close();

	void handleSignal(const SignalStructure &signal);
	void handleOffer(const SignalStructure &signal);
	void handleCandidate(const SignalStructure &signal);

	// On failure, connection holds what was registered before the throw, if anything
	void negotiate(const SignalStructure &signal, shared_ptr<Connection> &connection);

	void processStateChange(shared_ptr<Connection> connection, TransportState state);
	bool closeConnection(ConnectionId id);

	shared_ptr<Connection> getConnection(ConnectionId id) const;
	bool hasPendingCandidates(ConnectionId id) const;
	size_t connectionCount() const;
	size_t pendingCount() const;

	const NetworkId networkId;
	const ConnectionId connectionId;

	synchronized_callback<shared_ptr<Connection>> openConnectionCallback;
	synchronized_callback<ConnectionId, string> closeConnectionCallback;
	synchronized_callback<binary, ConnectionId> encapsulatedCallback;

private:
	void bindTransport(shared_ptr<Connection> connection, NetworkId remoteNetworkId);
	void drainPendingCandidates(const shared_ptr<Connection> &connection);
	void applyCandidate(const shared_ptr<Connection> &connection, const string &candidate);
	bool writeSignal(const SignalStructure &signal);
	void retire(ConnectionId id);
	void bufferUnclaimed(ConnectionId id, string candidate);
	void claim(ConnectionId id);

	void triggerOpenConnection(shared_ptr<Connection> connection);
	void triggerCloseConnection(ConnectionId id, string reason);

	const shared_ptr<SignalingChannel> mSignaling;
	const TransportFactory mTransportFactory;
	const size_t mRetiredLimit;
	const size_t mPendingLimit;

	// Guards the registry, the candidate buffer, the unclaimed ids and the retired set
	mutable std::mutex mMutex;
	ConnectionRegistry mConnections;
	CandidateBuffer mPendingCandidates;
	std::unordered_set<ConnectionId> mRetired;
	std::deque<ConnectionId> mRetiredOrder;
	std::deque<ConnectionId> mUnclaimedOrder; // buckets opened by a candidate before any offer
};

} // namespace nethernet::impl

#endif

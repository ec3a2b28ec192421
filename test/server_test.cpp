/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "nethernet/server.hpp"
#include "nethernet/errors.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>

using namespace nethernet;
using namespace nethernet::test;

namespace {

const NetworkId RemoteNetworkId = 777;

SignalStructure offer(ConnectionId id) {
	return SignalStructure(SignalType::ConnectRequest, id, "v=0 offer", RemoteNetworkId);
}

SignalStructure candidate(ConnectionId id, string data) {
	return SignalStructure(SignalType::CandidateAdd, id, std::move(data), RemoteNetworkId);
}

class ServerTest : public ::testing::Test {
protected:
	void SetUp() override {
		signaling = std::make_shared<FakeSignalingChannel>();

		Configuration config;
		config.networkId = 1;
		config.connectionId = 2;
		config.transportFactory = [this](const TransportConfiguration &) {
			if (failFactory)
				throw std::runtime_error("Out of ports");

			auto transport = std::make_shared<FakePeerTransport>();
			if (configure)
				configure(*transport);
			transports.push_back(transport);
			return transport;
		};

		server = std::make_unique<Server>(signaling, std::move(config));
		server->onOpenConnection(
		    [this](shared_ptr<Connection> connection) { opened.push_back(connection->id()); });
		server->onCloseConnection(
		    [this](ConnectionId id, string reason) { closed.emplace_back(id, std::move(reason)); });
	}

	void TearDown() override { server.reset(); }

	shared_ptr<FakeSignalingChannel> signaling;
	std::vector<shared_ptr<FakePeerTransport>> transports;
	std::function<void(FakePeerTransport &)> configure;
	bool failFactory = false;

	unique_ptr<Server> server;
	std::vector<ConnectionId> opened;
	std::vector<std::pair<ConnectionId, string>> closed;
};

} // namespace

TEST_F(ServerTest, UsesConfiguredIds) {
	EXPECT_EQ(server->networkId(), 1u);
	EXPECT_EQ(server->connectionId(), 2u);
}

TEST_F(ServerTest, DrawsRandomIdsWhenUnset) {
	Server a(signaling);
	Server b(signaling);
	EXPECT_NE(a.networkId(), b.networkId());
}

TEST_F(ServerTest, RequiresSignalingChannel) {
	EXPECT_THROW(Server(nullptr), std::invalid_argument);
}

TEST_F(ServerTest, OfferRegistersAndAnswersOnce) {
	server->handleSignal(offer(42));

	ASSERT_EQ(transports.size(), 1u);
	EXPECT_EQ(transports[0]->remoteSdp, "v=0 offer");
	EXPECT_EQ(transports[0]->remoteType, "offer");

	auto connection = server->getConnection(42);
	ASSERT_NE(connection, nullptr);
	EXPECT_EQ(connection->state(), Connection::State::Negotiating);

	auto responses = signaling->written(SignalType::ConnectResponse);
	ASSERT_EQ(responses.size(), 1u);
	EXPECT_EQ(responses[0].connectionId, 42u);
	EXPECT_EQ(responses[0].data, "v=0 answer");
	EXPECT_EQ(responses[0].networkId, RemoteNetworkId);
	EXPECT_EQ(signaling->written().size(), 1u);

	EXPECT_FALSE(server->hasPendingCandidates(42));
}

TEST_F(ServerTest, CandidatesAfterOfferAreAppliedInOrder) {
	server->handleSignal(offer(42));
	server->handleSignal(candidate(42, "candidate:1"));
	server->handleSignal(candidate(42, "candidate:2"));

	auto applied = transports[0]->applied();
	ASSERT_EQ(applied.size(), 2u);
	EXPECT_EQ(applied[0].candidate, "candidate:1");
	EXPECT_EQ(applied[1].candidate, "candidate:2");
	EXPECT_EQ(applied[0].mid, "0");
	EXPECT_EQ(applied[1].mid, "0");
	EXPECT_EQ(server->pendingCount(), 0u);
}

TEST_F(ServerTest, CandidateBeforeOfferIsAppliedAfterAnswer) {
	server->handleSignal(candidate(7, "early"));

	EXPECT_TRUE(transports.empty());
	EXPECT_TRUE(server->hasPendingCandidates(7));
	EXPECT_EQ(server->getConnection(7), nullptr);

	size_t responsesAtApply = 0;
	configure = [&](FakePeerTransport &transport) {
		transport.onAddCandidate = [&](const string &) {
			responsesAtApply = signaling->written(SignalType::ConnectResponse).size();
		};
	};

	server->handleSignal(offer(7));

	ASSERT_EQ(transports.size(), 1u);
	auto applied = transports[0]->applied();
	ASSERT_EQ(applied.size(), 1u);
	EXPECT_EQ(applied[0].candidate, "early");
	EXPECT_EQ(applied[0].mid, "0");
	EXPECT_EQ(responsesAtApply, 1u);
	EXPECT_FALSE(server->hasPendingCandidates(7));
	EXPECT_EQ(server->pendingCount(), 0u);
}

TEST_F(ServerTest, CandidatesDuringNegotiationKeepArrivalOrder) {
	server->handleSignal(candidate(3, "a"));

	configure = [this](FakePeerTransport &transport) {
		transport.onSetRemote = [this]() { server->handleCandidate(candidate(3, "b")); };
	};
	server->handleSignal(offer(3));
	server->handleSignal(candidate(3, "c"));

	ASSERT_EQ(transports.size(), 1u);
	EXPECT_EQ(transports[0]->appliedCandidates(), (std::vector<string>{"a", "b", "c"}));
}

TEST_F(ServerTest, CandidateArrivingWhileDrainingIsNotLost) {
	server->handleSignal(candidate(3, "a"));

	bool injected = false;
	configure = [&](FakePeerTransport &transport) {
		transport.onAddCandidate = [&](const string &) {
			if (!std::exchange(injected, true))
				server->handleCandidate(candidate(3, "b"));
		};
	};
	server->handleSignal(offer(3));

	ASSERT_EQ(transports.size(), 1u);
	EXPECT_EQ(transports[0]->appliedCandidates(), (std::vector<string>{"a", "b"}));
	EXPECT_FALSE(server->hasPendingCandidates(3));
}

TEST_F(ServerTest, UnknownCandidateBucketsAreBounded) {
	for (ConnectionId id = 1000; id < 3000; ++id)
		server->handleSignal(candidate(id, "x"));

	EXPECT_EQ(server->pendingCount(), Configuration().pendingConnectionsLimit);
	EXPECT_FALSE(server->hasPendingCandidates(1000));
	EXPECT_TRUE(server->hasPendingCandidates(2999));
	EXPECT_TRUE(transports.empty());
}

TEST_F(ServerTest, OldestUnknownCandidatesAreDroppedFirst) {
	Configuration config;
	config.pendingConnectionsLimit = 2;
	config.transportFactory = [this](const TransportConfiguration &) {
		auto transport = std::make_shared<FakePeerTransport>();
		transports.push_back(transport);
		return transport;
	};
	Server bounded(signaling, std::move(config));

	bounded.handleSignal(candidate(1, "a"));
	bounded.handleSignal(candidate(2, "b"));
	bounded.handleSignal(candidate(1, "a2"));
	// An offer claims its bucket, which no longer counts towards the limit
	bounded.handleSignal(offer(2));
	bounded.handleSignal(candidate(3, "c"));
	bounded.handleSignal(candidate(4, "d"));

	EXPECT_EQ(bounded.pendingCount(), 2u);
	EXPECT_FALSE(bounded.hasPendingCandidates(1));
	EXPECT_TRUE(bounded.hasPendingCandidates(3));
	EXPECT_TRUE(bounded.hasPendingCandidates(4));

	ASSERT_EQ(transports.size(), 1u);
	EXPECT_EQ(transports[0]->appliedCandidates(), (std::vector<string>{"b"}));

	bounded.handleSignal(offer(1));
	ASSERT_EQ(transports.size(), 2u);
	EXPECT_TRUE(transports[1]->applied().empty());
}

TEST_F(ServerTest, ZeroPendingLimitDropsUnknownCandidates) {
	Configuration config;
	config.pendingConnectionsLimit = 0;
	Server strict(signaling, std::move(config));

	strict.handleSignal(candidate(5, "x"));
	EXPECT_FALSE(strict.hasPendingCandidates(5));
	EXPECT_EQ(strict.pendingCount(), 0u);
}

TEST_F(ServerTest, ConnectedFiresOpenOnce) {
	server->handleSignal(offer(11));
	transports[0]->emitState(TransportState::Checking);
	EXPECT_TRUE(opened.empty());

	transports[0]->emitState(TransportState::Connected);
	transports[0]->emitState(TransportState::Completed);
	transports[0]->emitState(TransportState::Connected);

	ASSERT_EQ(opened.size(), 1u);
	EXPECT_EQ(opened[0], 11u);
	EXPECT_EQ(server->getConnection(11)->state(), Connection::State::Established);
}

TEST_F(ServerTest, FailedStateClosesExactlyOnce) {
	server->handleSignal(offer(5));
	transports[0]->emitState(TransportState::Failed);

	ASSERT_EQ(closed.size(), 1u);
	EXPECT_EQ(closed[0].first, 5u);
	EXPECT_EQ(closed[0].second, "failed");
	EXPECT_EQ(server->getConnection(5), nullptr);
	EXPECT_FALSE(server->hasPendingCandidates(5));
	EXPECT_TRUE(transports[0]->isClosed());

	transports[0]->emitState(TransportState::Closed);
	EXPECT_EQ(closed.size(), 1u);
	EXPECT_EQ(transports[0]->closeCount, 1);
}

TEST_F(ServerTest, DisconnectedIsTerminal) {
	server->handleSignal(offer(6));
	transports[0]->emitState(TransportState::Connected);
	transports[0]->emitState(TransportState::Disconnected);

	ASSERT_EQ(closed.size(), 1u);
	EXPECT_EQ(closed[0].second, "disconnected");
	EXPECT_EQ(server->connectionCount(), 0u);
}

TEST_F(ServerTest, ClosedReportedFromInsideCloseIsIgnored) {
	configure = [](FakePeerTransport &transport) { transport.emitClosedOnClose = true; };
	server->handleSignal(offer(5));
	transports[0]->emitState(TransportState::Failed);

	ASSERT_EQ(closed.size(), 1u);
	EXPECT_EQ(closed[0].second, "failed");
}

TEST_F(ServerTest, LateCandidateForClosedConnectionIsDropped) {
	server->handleSignal(offer(5));
	transports[0]->emitState(TransportState::Failed);

	server->handleSignal(candidate(5, "late"));

	EXPECT_FALSE(server->hasPendingCandidates(5));
	EXPECT_EQ(server->pendingCount(), 0u);
	EXPECT_EQ(server->connectionCount(), 0u);
	EXPECT_TRUE(transports[0]->applied().empty());
}

TEST_F(ServerTest, ClosedIdCanBeOfferedAgain) {
	server->handleSignal(offer(5));
	transports[0]->emitState(TransportState::Closed);

	server->handleSignal(offer(5));
	server->handleSignal(candidate(5, "again"));

	ASSERT_EQ(transports.size(), 2u);
	EXPECT_EQ(transports[1]->appliedCandidates(), (std::vector<string>{"again"}));
	EXPECT_NE(server->getConnection(5), nullptr);
}

TEST_F(ServerTest, OfferWithoutCredentialsIsRejected) {
	signaling->setCredentials(nullopt);

	EXPECT_NO_THROW(server->handleSignal(offer(8)));
	EXPECT_TRUE(transports.empty());
	EXPECT_EQ(server->connectionCount(), 0u);
	EXPECT_EQ(server->pendingCount(), 0u);
	EXPECT_TRUE(signaling->written().empty());

	EXPECT_THROW(server->handleOffer(offer(8)), ConfigurationError);
	EXPECT_EQ(server->connectionCount(), 0u);
}

TEST_F(ServerTest, RejectedOfferIsAbandoned) {
	configure = [](FakePeerTransport &transport) { transport.rejectOffer = true; };
	server->handleSignal(candidate(4, "early"));

	EXPECT_NO_THROW(server->handleSignal(offer(4)));

	EXPECT_EQ(server->connectionCount(), 0u);
	EXPECT_FALSE(server->hasPendingCandidates(4));
	EXPECT_TRUE(signaling->written().empty());
	ASSERT_EQ(transports.size(), 1u);
	EXPECT_TRUE(transports[0]->isClosed());
	ASSERT_EQ(closed.size(), 1u);
	EXPECT_EQ(closed[0].second, "failed");
}

TEST_F(ServerTest, TransportErrorDuringNegotiationAbandonsConnection) {
	configure = [](FakePeerTransport &transport) {
		transport.onSetRemote = []() { throw std::runtime_error("Transport exploded"); };
	};

	EXPECT_NO_THROW(server->handleSignal(offer(9)));

	EXPECT_EQ(server->getConnection(9), nullptr);
	EXPECT_FALSE(server->hasPendingCandidates(9));
	ASSERT_EQ(closed.size(), 1u);
	EXPECT_EQ(closed[0].first, 9u);
	EXPECT_EQ(closed[0].second, "failed");
	ASSERT_EQ(transports.size(), 1u);
	EXPECT_TRUE(transports[0]->isClosed());

	// Late candidates for the abandoned id are dropped, not buffered
	server->handleSignal(candidate(9, "c"));
	EXPECT_FALSE(server->hasPendingCandidates(9));
	EXPECT_EQ(server->pendingCount(), 0u);
	EXPECT_TRUE(transports[0]->applied().empty());
}

TEST_F(ServerTest, HandleOfferPropagatesNegotiationError) {
	configure = [](FakePeerTransport &transport) { transport.rejectOffer = true; };

	EXPECT_THROW(server->handleOffer(offer(4)), NegotiationError);
	// The registry entry is left for the caller to reconcile
	EXPECT_NE(server->getConnection(4), nullptr);
	EXPECT_TRUE(closed.empty());
}

TEST_F(ServerTest, MissingAnswerIsNegotiationError) {
	configure = [](FakePeerTransport &transport) { transport.answer.clear(); };

	EXPECT_THROW(server->handleOffer(offer(4)), NegotiationError);
	EXPECT_TRUE(signaling->written(SignalType::ConnectResponse).empty());
}

TEST_F(ServerTest, FailedAnswerWriteAbandonsConnection) {
	signaling->failWrite = true;
	server->handleSignal(offer(4));

	EXPECT_EQ(server->connectionCount(), 0u);
	ASSERT_EQ(closed.size(), 1u);
	EXPECT_EQ(closed[0].first, 4u);
}

TEST_F(ServerTest, TransportCreationFailure) {
	failFactory = true;

	EXPECT_THROW(server->handleOffer(offer(4)), NegotiationError);
	EXPECT_NO_THROW(server->handleSignal(offer(4)));
	EXPECT_EQ(server->connectionCount(), 0u);
	EXPECT_TRUE(signaling->written().empty());
}

TEST_F(ServerTest, CandidateApplyFailureIsSwallowed) {
	server->handleSignal(offer(12));
	transports[0]->close();

	EXPECT_NO_THROW(server->handleSignal(candidate(12, "after teardown")));
	EXPECT_TRUE(transports[0]->applied().empty());
}

TEST_F(ServerTest, NewOfferReplacesLiveConnection) {
	server->handleSignal(offer(9));
	auto first = server->getConnection(9);
	server->handleSignal(offer(9));

	ASSERT_EQ(transports.size(), 2u);
	EXPECT_TRUE(transports[0]->isClosed());
	EXPECT_FALSE(transports[1]->isClosed());
	ASSERT_EQ(closed.size(), 1u);
	EXPECT_EQ(closed[0].first, 9u);
	EXPECT_EQ(server->connectionCount(), 1u);
	EXPECT_NE(server->getConnection(9), first);

	// Late events from the replaced transport do not touch the new one
	transports[0]->emitState(TransportState::Failed);
	EXPECT_EQ(closed.size(), 1u);
	EXPECT_NE(server->getConnection(9), nullptr);
}

TEST_F(ServerTest, LocalCandidatesAreSignaled) {
	server->handleSignal(offer(13));
	transports[0]->emitLocalCandidate("candidate:local");

	auto candidates = signaling->written(SignalType::CandidateAdd);
	ASSERT_EQ(candidates.size(), 1u);
	EXPECT_EQ(candidates[0].connectionId, 13u);
	EXPECT_EQ(candidates[0].data, "candidate:local");
	EXPECT_EQ(candidates[0].networkId, RemoteNetworkId);
}

TEST_F(ServerTest, DataChannelsAreBoundByLabel) {
	std::vector<std::pair<string, ConnectionId>> messages;
	server->onEncapsulated([&messages](binary message, ConnectionId id) {
		messages.emplace_back(as_string(message), id);
	});

	server->handleSignal(offer(14));
	auto reliable = std::make_shared<FakeDataChannel>(ReliableChannelLabel);
	auto unreliable = std::make_shared<FakeDataChannel>(UnreliableChannelLabel);
	auto other = std::make_shared<FakeDataChannel>("other");
	transports[0]->emitDataChannel(reliable);
	transports[0]->emitDataChannel(unreliable);
	transports[0]->emitDataChannel(other);

	auto connection = server->getConnection(14);
	EXPECT_EQ(connection->reliableChannel(), reliable);
	EXPECT_EQ(connection->unreliableChannel(), unreliable);

	binary payload = to_binary("hello");
	payload.insert(payload.begin(), byte{0});
	reliable->receive(payload);

	ASSERT_EQ(messages.size(), 1u);
	EXPECT_EQ(messages[0].first, "hello");
	EXPECT_EQ(messages[0].second, 14u);
}

TEST_F(ServerTest, CloseWithoutConnectionsIsNoop) {
	EXPECT_NO_THROW(server->close());
	EXPECT_NO_THROW(server->close());
	EXPECT_TRUE(closed.empty());
}

TEST_F(ServerTest, CloseReleasesEverything) {
	server->handleSignal(offer(1));
	server->handleSignal(offer(2));
	server->handleSignal(candidate(3, "orphan"));

	server->close();

	EXPECT_EQ(server->connectionCount(), 0u);
	EXPECT_EQ(server->pendingCount(), 0u);
	EXPECT_EQ(closed.size(), 2u);
	for (const auto &transport : transports)
		EXPECT_TRUE(transport->isClosed());

	server->close();
	EXPECT_EQ(closed.size(), 2u);
}

TEST_F(ServerTest, CloseReachesConnectionsRegisteredWhileClosing) {
	server->handleSignal(offer(1));

	bool reoffered = false;
	server->onCloseConnection([&](ConnectionId id, string reason) {
		closed.emplace_back(id, std::move(reason));
		if (!std::exchange(reoffered, true))
			server->handleSignal(offer(2));
	});

	server->close();

	EXPECT_EQ(server->connectionCount(), 0u);
	EXPECT_EQ(server->pendingCount(), 0u);
	ASSERT_EQ(closed.size(), 2u);
	EXPECT_EQ(closed[0].first, 1u);
	EXPECT_EQ(closed[1].first, 2u);
	ASSERT_EQ(transports.size(), 2u);
	EXPECT_TRUE(transports[1]->isClosed());
}

TEST_F(ServerTest, CloseConnectionById) {
	server->handleSignal(offer(15));

	EXPECT_FALSE(server->closeConnection(16));
	EXPECT_TRUE(server->closeConnection(15));
	EXPECT_FALSE(server->closeConnection(15));

	ASSERT_EQ(closed.size(), 1u);
	EXPECT_EQ(closed[0].second, "closed");
}

TEST_F(ServerTest, ListenSubscribesAfterConnect) {
	server->listen();
	EXPECT_EQ(signaling->connectCount, 1);
	EXPECT_TRUE(signaling->subscribed());

	signaling->deliver(offer(20));
	EXPECT_NE(server->getConnection(20), nullptr);
}

TEST_F(ServerTest, ListenFailureIsReported) {
	signaling->failConnect = true;

	EXPECT_THROW(server->listen(), std::runtime_error);
	EXPECT_FALSE(signaling->subscribed());
}

TEST_F(ServerTest, OtherSignalTypesAreIgnored) {
	server->handleSignal(SignalStructure(SignalType::ConnectResponse, 1, "v=0", RemoteNetworkId));
	server->handleSignal(SignalStructure(SignalType::ConnectError, 1, "5", RemoteNetworkId));
	server->handleSignal(SignalStructure(SignalType::Unknown, 1, "", RemoteNetworkId));

	EXPECT_TRUE(transports.empty());
	EXPECT_EQ(server->connectionCount(), 0u);
	EXPECT_EQ(server->pendingCount(), 0u);
}

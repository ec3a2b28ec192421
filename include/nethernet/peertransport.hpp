/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_PEER_TRANSPORT_H
#define NETHERNET_PEER_TRANSPORT_H

#include "common.hpp"

#include "rtc/rtc.hpp"

#include <iostream>

namespace nethernet {

using IceServer = rtc::IceServer;

// 传输层连通状态，与 ICE 状态一一对应
enum class TransportState {
	New,
	Checking,
	Connected,
	Completed,
	Disconnected,
	Failed,
	Closed
};

// disconnected、failed、closed 之后不会再进入 connected
NETHERNET_CPP_EXPORT bool is_terminal(TransportState state);

NETHERNET_CPP_EXPORT string to_string(TransportState state);
NETHERNET_CPP_EXPORT std::ostream &operator<<(std::ostream &out, TransportState state);

struct TransportConfiguration {
	std::vector<IceServer> iceServers;
};

struct LocalDescription {
	string type;
	string sdp;
};

// 应用层数据通道
class NETHERNET_CPP_EXPORT DataChannel {
public:
	virtual ~DataChannel() = default;

	virtual string label() const = 0;
	virtual bool isOpen() const = 0;
	virtual bool isClosed() const = 0;

	virtual bool send(binary data) = 0;
	virtual void close() = 0;

	virtual void onOpen(std::function<void()> callback) = 0;
	virtual void onMessage(std::function<void(binary data)> callback) = 0;
};

// 底层实时传输引擎，负责 ICE、DTLS 与 SCTP
class NETHERNET_CPP_EXPORT PeerTransport {
public:
	virtual ~PeerTransport() = default;

	// Throws NegotiationError if the description is rejected
	virtual void setRemoteDescription(const string &sdp, const string &type) = 0;
	virtual optional<LocalDescription> localDescription() const = 0;

	// Throws TransportApplyError, most commonly after the transport is torn down
	virtual void addRemoteCandidate(const string &candidate, const string &mid) = 0;

	virtual void close() = 0;

	virtual void onLocalCandidate(std::function<void(string candidate)> callback) = 0;
	virtual void onDataChannel(std::function<void(shared_ptr<DataChannel> channel)> callback) = 0;
	virtual void onStateChange(std::function<void(TransportState state)> callback) = 0;
};

using TransportFactory =
    std::function<shared_ptr<PeerTransport>(const TransportConfiguration &config)>;

} // namespace nethernet

#endif

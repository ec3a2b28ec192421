/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "rtctransport.hpp"
#include "errors.hpp"

#include "impl/internals.hpp"

#include <algorithm>

namespace nethernet {

RtcDataChannel::RtcDataChannel(shared_ptr<rtc::DataChannel> channel)
    : mChannel(std::move(channel)) {}

RtcDataChannel::~RtcDataChannel() {
	mChannel->onOpen(nullptr);
	mChannel->onMessage(nullptr);
}

string RtcDataChannel::label() const { return mChannel->label(); }

bool RtcDataChannel::isOpen() const { return mChannel->isOpen(); }

bool RtcDataChannel::isClosed() const { return mChannel->isClosed(); }

bool RtcDataChannel::send(binary data) { return mChannel->send(std::move(data)); }

void RtcDataChannel::close() { mChannel->close(); }

void RtcDataChannel::onOpen(std::function<void()> callback) { mChannel->onOpen(callback); }

// 文本消息按原始字节交给上层
void RtcDataChannel::onMessage(std::function<void(binary data)> callback) {
	if (!callback) {
		mChannel->onMessage(nullptr);
		return;
	}

	mChannel->onMessage([callback](rtc::binary data) { callback(std::move(data)); },
	                    [callback](string text) {
		                    binary data(text.size());
		                    std::transform(text.begin(), text.end(), data.begin(),
		                                   [](char c) { return static_cast<byte>(c); });
		                    callback(std::move(data));
	                    });
}

RtcPeerTransport::RtcPeerTransport(const TransportConfiguration &config)
    : mPeerConnection([&config]() {
	      rtc::Configuration c;
	      c.iceServers = config.iceServers;
	      return std::make_shared<rtc::PeerConnection>(std::move(c));
      }()) {
	PLOG_VERBOSE << "Creating RtcPeerTransport with " << config.iceServers.size()
	             << " ICE servers";
}

RtcPeerTransport::~RtcPeerTransport() {
	mPeerConnection->onLocalCandidate(nullptr);
	mPeerConnection->onDataChannel(nullptr);
	mPeerConnection->onIceStateChange(nullptr);
}

// 函数 setRemoteDescription：设置远端描述
// 1. 解析失败或被拒绝时统一抛出 NegotiationError
void RtcPeerTransport::setRemoteDescription(const string &sdp, const string &type) {
	try {
		mPeerConnection->setRemoteDescription(rtc::Description(sdp, type));
	} catch (const std::exception &e) {
		throw NegotiationError(string("Remote description rejected: ") + e.what());
	}
}

optional<LocalDescription> RtcPeerTransport::localDescription() const {
	auto description = mPeerConnection->localDescription();
	if (!description)
		return nullopt;

	return LocalDescription{description->typeString(), string(*description)};
}

void RtcPeerTransport::addRemoteCandidate(const string &candidate, const string &mid) {
	try {
		mPeerConnection->addRemoteCandidate(rtc::Candidate(candidate, mid));
	} catch (const std::exception &e) {
		throw TransportApplyError(e.what());
	}
}

void RtcPeerTransport::close() { mPeerConnection->close(); }

void RtcPeerTransport::onLocalCandidate(std::function<void(string candidate)> callback) {
	if (!callback) {
		mPeerConnection->onLocalCandidate(nullptr);
		return;
	}

	mPeerConnection->onLocalCandidate(
	    [callback](rtc::Candidate candidate) { callback(candidate.candidate()); });
}

void RtcPeerTransport::onDataChannel(
    std::function<void(shared_ptr<DataChannel> channel)> callback) {
	if (!callback) {
		mPeerConnection->onDataChannel(nullptr);
		return;
	}

	mPeerConnection->onDataChannel([callback](shared_ptr<rtc::DataChannel> channel) {
		callback(std::make_shared<RtcDataChannel>(std::move(channel)));
	});
}

void RtcPeerTransport::onStateChange(std::function<void(TransportState state)> callback) {
	if (!callback) {
		mPeerConnection->onIceStateChange(nullptr);
		return;
	}

	mPeerConnection->onIceStateChange(
	    [callback](rtc::PeerConnection::IceState state) { callback(to_transport_state(state)); });
}

shared_ptr<PeerTransport> RtcPeerTransport::Create(const TransportConfiguration &config) {
	return std::make_shared<RtcPeerTransport>(config);
}

TransportState to_transport_state(rtc::PeerConnection::IceState state) {
	using IceState = rtc::PeerConnection::IceState;
	switch (state) {
	case IceState::New:
		return TransportState::New;
	case IceState::Checking:
		return TransportState::Checking;
	case IceState::Connected:
		return TransportState::Connected;
	case IceState::Completed:
		return TransportState::Completed;
	case IceState::Disconnected:
		return TransportState::Disconnected;
	case IceState::Failed:
		return TransportState::Failed;
	default:
		return TransportState::Closed;
	}
}

} // namespace nethernet

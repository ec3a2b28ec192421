/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_RTC_TRANSPORT_H
#define NETHERNET_RTC_TRANSPORT_H

#include "common.hpp"
#include "peertransport.hpp"

#include "rtc/rtc.hpp"

namespace nethernet {

// 基于 libdatachannel rtc::DataChannel 的数据通道
class NETHERNET_CPP_EXPORT RtcDataChannel final : public DataChannel {
public:
	RtcDataChannel(shared_ptr<rtc::DataChannel> channel);
	~RtcDataChannel();

	string label() const override;
	bool isOpen() const override;
	bool isClosed() const override;

	bool send(binary data) override;
	void close() override;

	void onOpen(std::function<void()> callback) override;
	void onMessage(std::function<void(binary data)> callback) override;

private:
	const shared_ptr<rtc::DataChannel> mChannel;
};

// 基于 libdatachannel rtc::PeerConnection 的传输实现
class NETHERNET_CPP_EXPORT RtcPeerTransport final : public PeerTransport {
public:
	RtcPeerTransport(const TransportConfiguration &config);
	~RtcPeerTransport();

	void setRemoteDescription(const string &sdp, const string &type) override;
	optional<LocalDescription> localDescription() const override;
	void addRemoteCandidate(const string &candidate, const string &mid) override;
	void close() override;

	void onLocalCandidate(std::function<void(string candidate)> callback) override;
	void onDataChannel(std::function<void(shared_ptr<DataChannel> channel)> callback) override;
	void onStateChange(std::function<void(TransportState state)> callback) override;

	static shared_ptr<PeerTransport> Create(const TransportConfiguration &config);

private:
	const shared_ptr<rtc::PeerConnection> mPeerConnection;
};

NETHERNET_CPP_EXPORT TransportState to_transport_state(rtc::PeerConnection::IceState state);

} // namespace nethernet

#endif

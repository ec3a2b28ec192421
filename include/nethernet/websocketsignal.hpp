/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_WEBSOCKET_SIGNAL_H
#define NETHERNET_WEBSOCKET_SIGNAL_H

#include "common.hpp"
#include "signalingchannel.hpp"

#include "rtc/rtc.hpp"

#include <chrono>

namespace nethernet {

// 通过 WebSocket 中继传递信令，消息为 JSON 信封
class NETHERNET_CPP_EXPORT WebSocketSignal final : public SignalingChannel {
public:
	// 信封中的 Type 字段
	enum class MessageType : int { Ping = 0, Signal = 1, Credentials = 2 };

	struct Configuration {
		string url;
		std::chrono::milliseconds connectionTimeout = std::chrono::seconds(10);
		optional<std::chrono::milliseconds> pingInterval = std::chrono::seconds(5);
		bool disableTlsVerification = false;
	};

	WebSocketSignal(Configuration config);
	~WebSocketSignal();

	void connect() override;
	void write(const SignalStructure &signal) override;
	void onSignal(std::function<void(SignalStructure signal)> callback) override;
	optional<std::vector<IceServer>> credentials() const override;

	void close();
	bool isOpen() const;

	// Handle one envelope received from the relay
	void incoming(const string &message);

	static string EncodeSignal(const SignalStructure &signal);
	static std::vector<IceServer> ParseCredentials(const string &message);
	static IceServer ParseIceUrl(const string &url, const string &username,
	                             const string &password);

private:
	shared_ptr<rtc::WebSocket> webSocket() const;

	const Configuration mConfig;

	// Written from the application thread, read from libdatachannel threads by write()
	mutable std::mutex mWebSocketMutex;
	shared_ptr<rtc::WebSocket> mWebSocket;

	mutable std::mutex mCredentialsMutex;
	optional<std::vector<IceServer>> mCredentials;

	synchronized_callback<SignalStructure> mSignalCallback;
};

} // namespace nethernet

#endif

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "websocketsignal.hpp"

#include "impl/internals.hpp"
#include "impl/utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <future>
#include <stdexcept>
#include <utility>

namespace nethernet {

using nlohmann::json;

namespace {

const uint16_t DefaultStunPort = 3478;
const uint16_t DefaultTurnsPort = 5349;

} // namespace

WebSocketSignal::WebSocketSignal(Configuration config) : mConfig(std::move(config)) {
	if (mConfig.url.empty())
		throw std::invalid_argument("Signaling URL is empty");
}

WebSocketSignal::~WebSocketSignal() {
	try {
		close();
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

// 函数 connect：打开到信令中继的 WebSocket 并等待结果
// 1. onOpen 与 onError 只有先到者生效
// 2. 超时后关闭套接字并抛出
void WebSocketSignal::connect() {
	rtc::WebSocket::Configuration wsConfig;
	wsConfig.disableTlsVerification = mConfig.disableTlsVerification;
	wsConfig.connectionTimeout = mConfig.connectionTimeout;
	wsConfig.pingInterval = mConfig.pingInterval;

	auto ws = std::make_shared<rtc::WebSocket>(std::move(wsConfig));

	auto promise = std::make_shared<std::promise<void>>();
	auto settled = std::make_shared<std::atomic<bool>>(false);
	auto future = promise->get_future();

	ws->onOpen([promise, settled]() {
		PLOG_INFO << "Signaling WebSocket open";
		if (!settled->exchange(true))
			promise->set_value();
	});

	ws->onError([promise, settled](string error) {
		PLOG_WARNING << "Signaling WebSocket error: " << error;
		if (!settled->exchange(true))
			promise->set_exception(std::make_exception_ptr(std::runtime_error(error)));
	});

	ws->onClosed([]() { PLOG_INFO << "Signaling WebSocket closed"; });

	ws->onMessage([this](rtc::message_variant data) {
		// Only text envelopes are part of the protocol
		if (!std::holds_alternative<string>(data))
			return;

		try {
			incoming(std::get<string>(data));
		} catch (const std::exception &e) {
			PLOG_WARNING << "Invalid signaling message: " << e.what();
		}
	});

	PLOG_DEBUG << "Connecting to signaling relay " << mConfig.url;
	ws->open(mConfig.url);

	if (future.wait_for(mConfig.connectionTimeout) != std::future_status::ready) {
		ws->close();
		throw std::runtime_error("Signaling connection timeout");
	}

	future.get(); // rethrows the connection error

	shared_ptr<rtc::WebSocket> previous;
	{
		std::lock_guard lock(mWebSocketMutex);
		previous = std::exchange(mWebSocket, std::move(ws));
	}
	if (previous) {
		previous->onMessage(nullptr);
		previous->close();
	}
}

shared_ptr<rtc::WebSocket> WebSocketSignal::webSocket() const {
	std::lock_guard lock(mWebSocketMutex);
	return mWebSocket;
}

void WebSocketSignal::write(const SignalStructure &signal) {
	auto ws = webSocket();
	if (!ws || !ws->isOpen())
		throw std::runtime_error("Signaling WebSocket is not open");

	PLOG_VERBOSE << "Sending signal " << signal;
	if (!ws->send(EncodeSignal(signal)))
		PLOG_DEBUG << "Signal buffered for sending";
}

void WebSocketSignal::onSignal(std::function<void(SignalStructure signal)> callback) {
	mSignalCallback = callback;
}

optional<std::vector<IceServer>> WebSocketSignal::credentials() const {
	std::lock_guard lock(mCredentialsMutex);
	return mCredentials;
}

void WebSocketSignal::close() {
	shared_ptr<rtc::WebSocket> ws;
	{
		std::lock_guard lock(mWebSocketMutex);
		ws = std::exchange(mWebSocket, nullptr);
	}
	if (ws) {
		ws->onMessage(nullptr);
		ws->close();
	}
}

bool WebSocketSignal::isOpen() const {
	auto ws = webSocket();
	return ws && ws->isOpen();
}

// 函数 incoming：处理中继下发的一条信封
// 1. Type 1 为信令，From 为发送方网络标识
// 2. Type 2 为凭据，替换当前的 ICE 服务器列表
// 3. Type 0 为心跳，忽略
void WebSocketSignal::incoming(const string &message) {
	json envelope = json::parse(message);

	auto it = envelope.find("Type");
	if (it == envelope.end())
		throw std::invalid_argument("Signaling message has no Type");

	const auto type = static_cast<MessageType>(it->get<int>());
	switch (type) {
	case MessageType::Signal: {
		NetworkId from = 0;
		if (auto jt = envelope.find("From"); jt != envelope.end()) {
			if (jt->is_number_unsigned()) {
				from = jt->get<NetworkId>();
			} else {
				auto parsed = impl::utils::parse_uint64(jt->get<string>());
				if (!parsed)
					throw std::invalid_argument("Invalid sender network id");
				from = *parsed;
			}
		}

		auto signal = SignalStructure::FromString(envelope.at("Message").get<string>(), from);
		PLOG_VERBOSE << "Received signal " << signal;
		mSignalCallback(std::move(signal));
		break;
	}
	case MessageType::Credentials: {
		auto servers = ParseCredentials(envelope.at("Message").get<string>());
		PLOG_DEBUG << "Received credentials with " << servers.size() << " ICE servers";
		std::lock_guard lock(mCredentialsMutex);
		mCredentials.emplace(std::move(servers));
		break;
	}
	case MessageType::Ping:
		break;

	default:
		PLOG_DEBUG << "Ignoring signaling message of type " << int(type);
		break;
	}
}

string WebSocketSignal::EncodeSignal(const SignalStructure &signal) {
	json envelope = {{"Type", int(MessageType::Signal)},
	                 {"To", std::to_string(signal.networkId)},
	                 {"Message", signal.toString()}};
	return envelope.dump();
}

std::vector<IceServer> WebSocketSignal::ParseCredentials(const string &message) {
	json credentials = json::parse(message);

	std::vector<IceServer> servers;
	auto it = credentials.find("TurnAuthServers");
	if (it == credentials.end() || !it->is_array())
		return servers;

	for (const auto &server : *it) {
		const string username = server.value("Username", "");
		const string password = server.value("Password", "");

		auto jt = server.find("Urls");
		if (jt == server.end())
			continue;

		for (const auto &url : *jt) {
			try {
				servers.push_back(ParseIceUrl(url.get<string>(), username, password));
			} catch (const std::invalid_argument &e) {
				PLOG_WARNING << "Ignoring ICE server: " << e.what();
			}
		}
	}

	return servers;
}

// 函数 ParseIceUrl：解析 stun:、turn:、turns: 形式的 URL
// 1. turn 默认走 UDP，transport=tcp 时改为 TCP
// 2. 未给端口时使用 3478，turns 使用 5349
// 3. libdatachannel 不支持 STUN over TLS，stuns: 视为不支持的协议
IceServer WebSocketSignal::ParseIceUrl(const string &url, const string &username,
                                       const string &password) {
	const size_t colon = url.find(':');
	if (colon == string::npos)
		throw std::invalid_argument("ICE URL has no scheme: " + url);

	const string scheme = url.substr(0, colon);
	string rest = url.substr(colon + 1);

	string query;
	if (size_t q = rest.find('?'); q != string::npos) {
		query = rest.substr(q + 1);
		rest.resize(q);
	}

	string hostname = rest;
	uint16_t port = scheme == "turns" ? DefaultTurnsPort : DefaultStunPort;
	if (size_t p = rest.rfind(':'); p != string::npos && rest.find(']', p) == string::npos) {
		auto parsed = impl::utils::parse_uint64(string_view(rest).substr(p + 1));
		if (!parsed || *parsed == 0 || *parsed > 65535)
			throw std::invalid_argument("Invalid ICE server port: " + url);

		hostname = rest.substr(0, p);
		port = uint16_t(*parsed);
	}

	if (hostname.size() > 2 && hostname.front() == '[' && hostname.back() == ']')
		hostname = hostname.substr(1, hostname.size() - 2);

	if (hostname.empty())
		throw std::invalid_argument("ICE URL has no host: " + url);

	if (scheme == "stun")
		return IceServer(hostname, port);

	if (scheme == "turn") {
		auto relayType = query == "transport=tcp" ? IceServer::RelayType::TurnTcp
		                                          : IceServer::RelayType::TurnUdp;
		return IceServer(hostname, port, username, password, relayType);
	}

	if (scheme == "turns")
		return IceServer(hostname, port, username, password, IceServer::RelayType::TurnTls);

	throw std::invalid_argument("Unsupported ICE URL scheme: " + scheme);
}

} // namespace nethernet

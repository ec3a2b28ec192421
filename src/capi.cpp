/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "nethernet.h"
#include "nethernet.hpp"

#include "impl/internals.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>
#include <utility>

using namespace nethernet;

namespace {
// 以 int 句柄保存主机对象
std::unordered_map<int, shared_ptr<Server>> serverMap;
// 与各个句柄关联的用户指针
std::unordered_map<int, void *> userPointerMap;
std::mutex mutex;
int lastId = 0;

optional<void *> getUserPointer(int id) {
	std::lock_guard lock(mutex);
	auto it = userPointerMap.find(id);
	return it != userPointerMap.end() ? std::make_optional(it->second) : nullopt;
}

void setUserPointer(int i, void *ptr) {
	std::lock_guard lock(mutex);
	userPointerMap[i] = ptr;
}

shared_ptr<Server> getServer(int id) {
	std::lock_guard lock(mutex);
	if (auto it = serverMap.find(id); it != serverMap.end())
		return it->second;
	else
		throw std::invalid_argument("Server ID does not exist");
}

int emplaceServer(shared_ptr<Server> ptr) {
	std::lock_guard lock(mutex);
	int server = ++lastId;
	serverMap.emplace(std::make_pair(server, ptr));
	userPointerMap.emplace(std::make_pair(server, nullptr));
	return server;
}

// 取出而不是直接删除，析构放到锁外进行
shared_ptr<Server> eraseServer(int server) {
	std::lock_guard lock(mutex);
	auto it = serverMap.find(server);
	if (it == serverMap.end())
		throw std::invalid_argument("Server ID does not exist");

	auto ptr = std::move(it->second);
	serverMap.erase(it);
	userPointerMap.erase(server);
	return ptr;
}

size_t eraseAll() {
	std::unordered_map<int, shared_ptr<Server>> servers;
	{
		std::lock_guard lock(mutex);
		servers = std::exchange(serverMap, {});
		userPointerMap.clear();
	}
	return servers.size();
}

template <typename F> int wrap(F func) {
	try {
		return int(func());

	} catch (const std::invalid_argument &e) {
		PLOG_ERROR << e.what();
		return NTH_ERR_INVALID;
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
		return NTH_ERR_FAILURE;
	}
}

} // namespace

void nthInitLogger(nthLogLevel level, nthLogCallbackFunc cb) {
	LogCallback callback = nullptr;
	if (cb)
		callback = [cb](LogLevel level, string message) {
			cb(static_cast<nthLogLevel>(level), message.c_str());
		};

	InitLogger(static_cast<LogLevel>(level), callback);
}

void nthSetUserPointer(int i, void *ptr) { setUserPointer(i, ptr); }

void *nthGetUserPointer(int i) { return getUserPointer(i).value_or(nullptr); }

// nthCreateServer：创建经 WebSocket 中继收发信令的主机，返回句柄
int nthCreateServer(const nthConfiguration *config) {
	return wrap([config] {
		if (!config || !config->signalingUrl)
			throw std::invalid_argument("Unexpected null pointer for signaling URL");

		WebSocketSignal::Configuration wsConfig;
		wsConfig.url = string(config->signalingUrl);
		wsConfig.disableTlsVerification = config->disableTlsVerification;
		if (config->connectionTimeoutMs > 0)
			wsConfig.connectionTimeout = std::chrono::milliseconds(config->connectionTimeoutMs);
		else if (config->connectionTimeoutMs < 0)
			throw std::invalid_argument("Invalid connection timeout");

		Configuration c;
		if (config->networkId != 0)
			c.networkId = config->networkId;
		if (config->connectionId != 0)
			c.connectionId = config->connectionId;

		auto signaling = std::make_shared<WebSocketSignal>(std::move(wsConfig));
		return emplaceServer(std::make_shared<Server>(std::move(signaling), std::move(c)));
	});
}

int nthDeleteServer(int server) {
	return wrap([server] {
		auto ptr = eraseServer(server);
		ptr->onOpenConnection(nullptr);
		ptr->onCloseConnection(nullptr);
		ptr->onEncapsulated(nullptr);
		ptr->close();
		return NTH_ERR_SUCCESS;
	});
}

int nthListen(int server) {
	return wrap([server] {
		getServer(server)->listen();
		return NTH_ERR_SUCCESS;
	});
}

int nthCloseServer(int server) {
	return wrap([server] {
		getServer(server)->close();
		return NTH_ERR_SUCCESS;
	});
}

int nthGetNetworkId(int server, uint64_t *networkId) {
	return wrap([&] {
		if (!networkId)
			throw std::invalid_argument("Unexpected null pointer for network id");

		*networkId = getServer(server)->networkId();
		return NTH_ERR_SUCCESS;
	});
}

int nthGetConnectionCount(int server) {
	return wrap([server] { return int(getServer(server)->connectionCount()); });
}

int nthSetOpenConnectionCallback(int server, nthOpenConnectionCallbackFunc cb) {
	return wrap([&] {
		auto ptr = getServer(server);
		if (cb)
			ptr->onOpenConnection([server, cb](shared_ptr<Connection> connection) {
				if (auto user = getUserPointer(server))
					cb(server, connection->id(), *user);
			});
		else
			ptr->onOpenConnection(nullptr);
		return NTH_ERR_SUCCESS;
	});
}

int nthSetCloseConnectionCallback(int server, nthCloseConnectionCallbackFunc cb) {
	return wrap([&] {
		auto ptr = getServer(server);
		if (cb)
			ptr->onCloseConnection([server, cb](ConnectionId id, string reason) {
				if (auto user = getUserPointer(server))
					cb(server, id, reason.c_str(), *user);
			});
		else
			ptr->onCloseConnection(nullptr);
		return NTH_ERR_SUCCESS;
	});
}

int nthSetEncapsulatedCallback(int server, nthEncapsulatedCallbackFunc cb) {
	return wrap([&] {
		auto ptr = getServer(server);
		if (cb)
			ptr->onEncapsulated([server, cb](binary message, ConnectionId id) {
				if (auto user = getUserPointer(server))
					cb(server, id, reinterpret_cast<const char *>(message.data()),
					   int(message.size()), *user);
			});
		else
			ptr->onEncapsulated(nullptr);
		return NTH_ERR_SUCCESS;
	});
}

int nthSendMessage(int server, uint64_t connectionId, const char *data, int size) {
	return wrap([&] {
		if (!data && size != 0)
			throw std::invalid_argument("Unexpected null pointer for data");
		if (size < 0)
			throw std::invalid_argument("Invalid message size");

		auto connection = getServer(server)->getConnection(connectionId);
		if (!connection)
			throw std::invalid_argument("Connection ID does not exist");

		auto b = reinterpret_cast<const byte *>(data);
		return int(connection->send(binary(b, b + size)));
	});
}

int nthCloseConnection(int server, uint64_t connectionId) {
	return wrap([&] {
		if (!getServer(server)->closeConnection(connectionId))
			return NTH_ERR_NOT_AVAIL;

		return NTH_ERR_SUCCESS;
	});
}

void nthCleanup() {
	try {
		size_t count = eraseAll();
		if (count != 0) {
			PLOG_INFO << count << " servers were not properly destroyed before cleanup";
		}

		if (rtc::Cleanup().wait_for(std::chrono::seconds(10)) == std::future_status::timeout)
			throw std::runtime_error(
			    "Cleanup timeout (possible deadlock or undestructible object)");

	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

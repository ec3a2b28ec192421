/**
 * nethernet echo host example
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "nethernet/nethernet.hpp"

#include "parse_cl.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace std::chrono_literals;
using std::shared_ptr;

namespace {

std::atomic<bool> running = true;

void onInterrupt(int) { running = false; }

} // namespace

int main(int argc, char **argv) try {
	Cmdline params(argc, argv);

	nethernet::InitLogger(params.verbose() ? nethernet::LogLevel::Debug
	                                       : nethernet::LogLevel::Info);

	// 1. 信令通道
	nethernet::WebSocketSignal::Configuration wsConfig;
	wsConfig.url = params.signalingUrl();
	wsConfig.connectionTimeout = std::chrono::milliseconds(params.timeoutMs());
	wsConfig.disableTlsVerification = params.insecure();
	auto signaling = std::make_shared<nethernet::WebSocketSignal>(wsConfig);

	// 2. 主机
	nethernet::Configuration config;
	if (params.networkId() != 0)
		config.networkId = params.networkId();

	auto server = std::make_shared<nethernet::Server>(signaling, config);
	std::cout << "The local network ID is " << server->networkId() << std::endl;

	std::weak_ptr<nethernet::Server> wserver = server;

	server->onOpenConnection([](shared_ptr<nethernet::Connection> connection) {
		std::cout << "Connection " << connection->id() << " open" << std::endl;
	});

	server->onCloseConnection([](nethernet::ConnectionId id, std::string reason) {
		std::cout << "Connection " << id << " closed: " << reason << std::endl;
	});

	// 3. 收到的数据原样发回
	server->onEncapsulated([wserver](nethernet::binary message, nethernet::ConnectionId id) {
		std::cout << "Message from " << id << " received, size=" << message.size() << std::endl;
		auto server = wserver.lock();
		if (!server)
			return;

		if (auto connection = server->getConnection(id))
			connection->send(std::move(message));
	});

	std::cout << "Connecting to " << wsConfig.url << std::endl;
	server->listen();

	std::signal(SIGINT, onInterrupt);
	std::signal(SIGTERM, onInterrupt);

	std::cout << "Waiting for connections, press Ctrl+C to stop" << std::endl;
	while (running)
		std::this_thread::sleep_for(100ms);

	std::cout << "Cleaning up..." << std::endl;
	server->close();
	server.reset();
	signaling->close();
	return 0;

} catch (const std::exception &e) {
	std::cout << "Error: " << e.what() << std::endl;
	return -1;
}

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "connectionregistry.hpp"

#include <utility>

namespace nethernet::impl {

shared_ptr<Connection> ConnectionRegistry::registerConnection(ConnectionId id,
                                                              shared_ptr<Connection> connection) {
	auto &entry = mConnections[id];
	return std::exchange(entry, std::move(connection));
}

shared_ptr<Connection> ConnectionRegistry::lookup(ConnectionId id) const {
	if (auto it = mConnections.find(id); it != mConnections.end())
		return it->second;
	else
		return nullptr;
}

bool ConnectionRegistry::unregisterConnection(ConnectionId id) {
	return mConnections.erase(id) != 0;
}

std::vector<shared_ptr<Connection>> ConnectionRegistry::values() const {
	std::vector<shared_ptr<Connection>> result;
	result.reserve(mConnections.size());
	for (const auto &[id, connection] : mConnections)
		result.push_back(connection);

	return result;
}

void ConnectionRegistry::clear() { mConnections.clear(); }

size_t ConnectionRegistry::size() const { return mConnections.size(); }

} // namespace nethernet::impl

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_IMPL_CONNECTION_REGISTRY_H
#define NETHERNET_IMPL_CONNECTION_REGISTRY_H

#include "common.hpp"
#include "connection.hpp"

#include <unordered_map>
#include <vector>

namespace nethernet::impl {

// 连接标识到 Connection 的映射
// Not synchronized, the owner serializes access
class ConnectionRegistry final {
public:
	// Inserts or overwrites, returns the replaced connection if any
	shared_ptr<Connection> registerConnection(ConnectionId id, shared_ptr<Connection> connection);
	shared_ptr<Connection> lookup(ConnectionId id) const;
	bool unregisterConnection(ConnectionId id);

	// Snapshot used at shutdown
	std::vector<shared_ptr<Connection>> values() const;

	void clear();
	size_t size() const;

private:
	std::unordered_map<ConnectionId, shared_ptr<Connection>> mConnections;
};

} // namespace nethernet::impl

#endif

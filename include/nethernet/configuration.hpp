/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_CONFIGURATION_H
#define NETHERNET_CONFIGURATION_H

#include "common.hpp"
#include "peertransport.hpp"

namespace nethernet {

struct NETHERNET_CPP_EXPORT Configuration {
	// Random 64-bit values are drawn when unset
	optional<NetworkId> networkId;
	optional<ConnectionId> connectionId;

	// Defaults to a libdatachannel PeerConnection
	TransportFactory transportFactory;

	// Number of closed connection ids remembered to drop late candidates
	size_t retiredConnectionsLimit = 1024;

	// Number of ids without an offer whose candidates are buffered, oldest dropped first
	size_t pendingConnectionsLimit = 256;
};

} // namespace nethernet

#endif

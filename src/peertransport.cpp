/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "peertransport.hpp"

namespace nethernet {

bool is_terminal(TransportState state) {
	switch (state) {
	case TransportState::Disconnected:
	case TransportState::Failed:
	case TransportState::Closed:
		return true;
	default:
		return false;
	}
}

string to_string(TransportState state) {
	switch (state) {
	case TransportState::New:
		return "new";
	case TransportState::Checking:
		return "checking";
	case TransportState::Connected:
		return "connected";
	case TransportState::Completed:
		return "completed";
	case TransportState::Disconnected:
		return "disconnected";
	case TransportState::Failed:
		return "failed";
	case TransportState::Closed:
		return "closed";
	default:
		return "unknown";
	}
}

std::ostream &operator<<(std::ostream &out, TransportState state) {
	return out << to_string(state);
}

} // namespace nethernet

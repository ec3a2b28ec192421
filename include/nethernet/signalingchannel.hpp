/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_SIGNALING_CHANNEL_H
#define NETHERNET_SIGNALING_CHANNEL_H

#include "common.hpp"
#include "peertransport.hpp"
#include "signal.hpp"

namespace nethernet {

// 信令通道，负责 offer/answer/candidate 的实际投递
class NETHERNET_CPP_EXPORT SignalingChannel {
public:
	virtual ~SignalingChannel() = default;

	// Throws if the relay is unreachable or refuses the host
	virtual void connect() = 0;
	virtual void write(const SignalStructure &signal) = 0;
	virtual void onSignal(std::function<void(SignalStructure signal)> callback) = 0;

	// ICE servers handed out by the relay, nullopt until received
	virtual optional<std::vector<IceServer>> credentials() const = 0;
};

} // namespace nethernet

#endif

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef NETHERNET_SIGNAL_H
#define NETHERNET_SIGNAL_H

#include "common.hpp"

#include <iostream>

namespace nethernet {

// 信令消息类型
enum class SignalType {
	ConnectRequest,  // 携带 SDP offer
	ConnectResponse, // 携带 SDP answer
	CandidateAdd,    // 携带 ICE 候选
	ConnectError,    // 对端报告的错误码
	Unknown
};

// 一条信令消息，文本形式为 "<TYPE> <connectionId> <data>"
struct NETHERNET_CPP_EXPORT SignalStructure {
	SignalStructure(SignalType type, ConnectionId connectionId, string data,
	                NetworkId networkId = 0);

	// Parse the text form; data after the second space is kept verbatim
	static SignalStructure FromString(string_view message, NetworkId networkId = 0);

	string toString() const;

	SignalType type;
	ConnectionId connectionId;
	string data;
	NetworkId networkId;
};

NETHERNET_CPP_EXPORT string to_string(SignalType type);
NETHERNET_CPP_EXPORT SignalType signal_type_from_string(string_view str);

NETHERNET_CPP_EXPORT std::ostream &operator<<(std::ostream &out, SignalType type);
NETHERNET_CPP_EXPORT std::ostream &operator<<(std::ostream &out, const SignalStructure &signal);

} // namespace nethernet

#endif

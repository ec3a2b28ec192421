/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "signal.hpp"

#include "impl/utils.hpp"

#include <sstream>
#include <stdexcept>

namespace nethernet {

SignalStructure::SignalStructure(SignalType type_, ConnectionId connectionId_, string data_,
                                 NetworkId networkId_)
    : type(type_), connectionId(connectionId_), data(std::move(data_)), networkId(networkId_) {}

// 函数 FromString：解析文本形式的信令
// 1. 第一个空格前为类型，第二个空格前为连接标识，其余原样作为数据
SignalStructure SignalStructure::FromString(string_view message, NetworkId networkId) {
	const size_t first = message.find(' ');
	if (first == string_view::npos)
		throw std::invalid_argument("Signal has no connection id");

	const string_view typeStr = message.substr(0, first);
	string_view rest = message.substr(first + 1);

	string_view idStr = rest;
	string_view data;
	if (const size_t second = rest.find(' '); second != string_view::npos) {
		idStr = rest.substr(0, second);
		data = rest.substr(second + 1);
	}

	auto connectionId = impl::utils::parse_uint64(idStr);
	if (!connectionId)
		throw std::invalid_argument("Invalid signal connection id \"" + string(idStr) + "\"");

	return SignalStructure(signal_type_from_string(typeStr), *connectionId, string(data),
	                       networkId);
}

string SignalStructure::toString() const {
	std::ostringstream oss;
	oss << type << ' ' << connectionId << ' ' << data;
	return oss.str();
}

string to_string(SignalType type) {
	switch (type) {
	case SignalType::ConnectRequest:
		return "CONNECTREQUEST";
	case SignalType::ConnectResponse:
		return "CONNECTRESPONSE";
	case SignalType::CandidateAdd:
		return "CANDIDATEADD";
	case SignalType::ConnectError:
		return "CONNECTERROR";
	default:
		return "UNKNOWN";
	}
}

SignalType signal_type_from_string(string_view str) {
	if (str == "CONNECTREQUEST")
		return SignalType::ConnectRequest;
	if (str == "CONNECTRESPONSE")
		return SignalType::ConnectResponse;
	if (str == "CANDIDATEADD")
		return SignalType::CandidateAdd;
	if (str == "CONNECTERROR")
		return SignalType::ConnectError;

	return SignalType::Unknown;
}

std::ostream &operator<<(std::ostream &out, SignalType type) { return out << to_string(type); }

std::ostream &operator<<(std::ostream &out, const SignalStructure &signal) {
	return out << signal.type << " connectionId=" << signal.connectionId
	           << " networkId=" << signal.networkId << " (" << signal.data.size() << " bytes)";
}

} // namespace nethernet

/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef PARSE_CL_H
#define PARSE_CL_H

#include <cstdint>
#include <string>

class Cmdline {
public:
	Cmdline(int argc, char *argv[]);

	std::string signalingUrl() const { return _u; }
	uint64_t networkId() const { return _n; }
	int timeoutMs() const { return _t; }
	bool insecure() const { return _k; }
	bool verbose() const { return _v; }

	static void usage(const char *program);

private:
	std::string _u = "ws://127.0.0.1:8000/";
	uint64_t _n = 0;
	int _t = 10000;
	bool _k = false;
	bool _v = false;
};

#endif

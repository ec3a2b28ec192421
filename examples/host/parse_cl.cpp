/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "parse_cl.h"

#include <getopt.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

Cmdline::Cmdline(int argc, char *argv[]) {
	static struct option long_options[] = {{"url", required_argument, nullptr, 'u'},
	                                       {"network-id", required_argument, nullptr, 'n'},
	                                       {"timeout", required_argument, nullptr, 't'},
	                                       {"insecure", no_argument, nullptr, 'k'},
	                                       {"verbose", no_argument, nullptr, 'v'},
	                                       {"help", no_argument, nullptr, 'h'},
	                                       {nullptr, 0, nullptr, 0}};

	int c;
	while ((c = getopt_long(argc, argv, "u:n:t:kvh", long_options, nullptr)) != -1) {
		switch (c) {
		case 'u':
			_u = optarg;
			break;
		case 'n':
			try {
				_n = std::stoull(optarg);
			} catch (const std::exception &) {
				throw std::invalid_argument("Invalid network id \"" + std::string(optarg) + "\"");
			}
			break;
		case 't':
			try {
				_t = std::stoi(optarg);
			} catch (const std::exception &) {
				throw std::invalid_argument("Invalid timeout \"" + std::string(optarg) + "\"");
			}
			if (_t <= 0)
				throw std::invalid_argument("Timeout must be positive");
			break;
		case 'k':
			_k = true;
			break;
		case 'v':
			_v = true;
			break;
		case 'h':
			usage(argv[0]);
			std::exit(EXIT_SUCCESS);
		default:
			usage(argv[0]);
			std::exit(EXIT_FAILURE);
		}
	}
}

void Cmdline::usage(const char *program) {
	std::cout << "usage: " << program << " [-u url] [-n network-id] [-t timeout-ms] [-k] [-v]\n"
	          << "  -u, --url         signaling relay WebSocket URL\n"
	          << "  -n, --network-id  network id to register, random if unset\n"
	          << "  -t, --timeout     signaling connection timeout in milliseconds\n"
	          << "  -k, --insecure    disable TLS certificate verification\n"
	          << "  -v, --verbose     verbose logging\n";
}

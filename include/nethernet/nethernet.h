/**
 * Copyright (c) 2024 nethernet authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

// nethernet 主机的 C API，对象以整数句柄表示

#ifndef NETHERNET_C_API
#define NETHERNET_C_API

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stdint.h>

#ifdef NETHERNET_STATIC
#define NTH_C_EXPORT
#else // dynamic library
#ifdef _WIN32
#ifdef NETHERNET_EXPORTS
#define NTH_C_EXPORT __declspec(dllexport) // building the library
#else
#define NTH_C_EXPORT __declspec(dllimport) // using the library
#endif
#else // not WIN32
#define NTH_C_EXPORT
#endif
#endif

#ifdef _WIN32
#ifdef CAPI_STDCALL
#define NTH_API __stdcall
#else
#define NTH_API
#endif
#else // not WIN32
#define NTH_API
#endif

typedef enum { // Don't change, it must match plog severity
	NTH_LOG_NONE = 0,
	NTH_LOG_FATAL = 1,
	NTH_LOG_ERROR = 2,
	NTH_LOG_WARNING = 3,
	NTH_LOG_INFO = 4,
	NTH_LOG_DEBUG = 5,
	NTH_LOG_VERBOSE = 6
} nthLogLevel;

#define NTH_ERR_SUCCESS 0
#define NTH_ERR_INVALID -1   // invalid argument
#define NTH_ERR_FAILURE -2   // runtime error
#define NTH_ERR_NOT_AVAIL -3 // element not available
#define NTH_ERR_TOO_SMALL -4 // buffer too small

typedef void(NTH_API *nthLogCallbackFunc)(nthLogLevel level, const char *message);
typedef void(NTH_API *nthOpenConnectionCallbackFunc)(int server, uint64_t connectionId,
                                                     void *ptr);
typedef void(NTH_API *nthCloseConnectionCallbackFunc)(int server, uint64_t connectionId,
                                                      const char *reason, void *ptr);
typedef void(NTH_API *nthEncapsulatedCallbackFunc)(int server, uint64_t connectionId,
                                                   const char *message, int size, void *ptr);

// Log

// NULL cb on the first call will log to stdout
NTH_C_EXPORT void nthInitLogger(nthLogLevel level, nthLogCallbackFunc cb);

// User pointer
NTH_C_EXPORT void nthSetUserPointer(int id, void *ptr);
NTH_C_EXPORT void *nthGetUserPointer(int id);

// Server

typedef struct {
	const char *signalingUrl; // WebSocket relay URL
	uint64_t networkId;       // 0 for random
	uint64_t connectionId;    // 0 for random
	int connectionTimeoutMs;  // 0 for default
	bool disableTlsVerification;
} nthConfiguration;

NTH_C_EXPORT int nthCreateServer(const nthConfiguration *config); // returns server id
NTH_C_EXPORT int nthDeleteServer(int server);

NTH_C_EXPORT int nthListen(int server);
NTH_C_EXPORT int nthCloseServer(int server);

NTH_C_EXPORT int nthGetNetworkId(int server, uint64_t *networkId);
NTH_C_EXPORT int nthGetConnectionCount(int server);

NTH_C_EXPORT int nthSetOpenConnectionCallback(int server, nthOpenConnectionCallbackFunc cb);
NTH_C_EXPORT int nthSetCloseConnectionCallback(int server, nthCloseConnectionCallbackFunc cb);
NTH_C_EXPORT int nthSetEncapsulatedCallback(int server, nthEncapsulatedCallbackFunc cb);

// Connection

// returns the number of bytes sent, 0 if queued
NTH_C_EXPORT int nthSendMessage(int server, uint64_t connectionId, const char *data, int size);
NTH_C_EXPORT int nthCloseConnection(int server, uint64_t connectionId);

// Cleanup

NTH_C_EXPORT void nthCleanup(void);

#ifdef __cplusplus
} // extern "C"
#endif

#endif

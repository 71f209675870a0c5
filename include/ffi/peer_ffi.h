/* Copyright (c) 2025 The Lanpeer Developers */
/* Distributed under the MIT software license */

#ifndef LANPEER_FFI_PEER_FFI_H
#define LANPEER_FFI_PEER_FFI_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Start advertising `identifier` on the local network and logging the peers
 * seen there. Returns immediately. false means nothing was started: the
 * pointer was null, the bytes were not UTF-8, or the runtime could not be
 * created. Errors after that point are only logged.
 *
 * The string is copied; the caller keeps ownership.
 */
bool peer_start(const char *identifier);

/* Stop every session started through peer_start(). Safe to call repeatedly. */
void peer_stop(void);

/* peer_start("bob") */
bool bob_start(void);

/* Same as peer_stop() */
void bob_stop(void);

#ifdef __cplusplus
}
#endif

#endif /* LANPEER_FFI_PEER_FFI_H */

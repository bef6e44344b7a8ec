/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_DEBUG_HPP_INCLUDED__
#define __RCONLINK_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Unified debug macros
//  Enable with -DRCONLINK_DEBUG=1 during compilation
//
//  Usage:
//    RCON_DBG_DECODER("declared size %d, readable %zu", size, readable);
//    RCON_DBG_STREAM("read completed: %zu bytes", bytes);

#if defined RCONLINK_DEBUG && RCONLINK_DEBUG

#define RCON_DBG(category, fmt, ...)                                           \
    do {                                                                       \
        fprintf (stderr, "[RCON:" category "] " fmt "\n", ##__VA_ARGS__);      \
    } while (0)

#define RCON_DBG_THIS(category, fmt, ...)                                      \
    do {                                                                       \
        fprintf (stderr, "[RCON:" category ":%p] " fmt "\n",                   \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define RCON_DBG(category, fmt, ...) ((void) 0)
#define RCON_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define RCON_DBG_DECODER(fmt, ...) RCON_DBG_THIS ("DECODER", fmt, ##__VA_ARGS__)
#define RCON_DBG_STREAM(fmt, ...) RCON_DBG_THIS ("STREAM", fmt, ##__VA_ARGS__)

//  Severity-based macros (with this pointer)
#define RCON_LOG_ERROR(fmt, ...) RCON_DBG_THIS ("ERROR", fmt, ##__VA_ARGS__)
#define RCON_LOG_WARN(fmt, ...) RCON_DBG_THIS ("WARN", fmt, ##__VA_ARGS__)

#endif

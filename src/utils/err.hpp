/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_ERR_HPP_INCLUDED__
#define __RCONLINK_ERR_HPP_INCLUDED__

#include <errno.h>
#include <string.h>
#include <stdlib.h>
#include <stdio.h>

#include "utils/likely.hpp"

//  rconlink-specific error codes are defined in rconlink.h

namespace rconlink
{
const char *errno_to_string (int errno_);
#if defined __clang__
#if __has_feature(attribute_analyzer_noreturn)
void rconlink_abort (const char *errmsg_) __attribute__ ((analyzer_noreturn));
#else
void rconlink_abort (const char *errmsg_);
#endif
#else
void rconlink_abort (const char *errmsg_);
#endif
}

//  This macro works in exactly the same way as the normal assert. It is used
//  in its stead because it stays active in release builds.
#define rconlink_assert(x)                                                     \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "Assertion failed: %s (%s:%d)\n", #x, __FILE__,   \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            rconlink::rconlink_abort (#x);                                     \
        }                                                                      \
    } while (false)

//  Provides convenient way to check whether memory allocation have succeeded.
#define alloc_assert(x)                                                        \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "FATAL ERROR: OUT OF MEMORY (%s:%d)\n", __FILE__, \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            rconlink::rconlink_abort ("FATAL ERROR: OUT OF MEMORY");           \
        }                                                                      \
    } while (false)

#endif

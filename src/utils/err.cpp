/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

const char *rconlink::errno_to_string (int errno_)
{
    switch (errno_) {
#if EPROTO == RCONLINK_HAUSNUMERO + 1
        case EPROTO:
            return "Protocol error";
#endif
#if EMSGSIZE == RCONLINK_HAUSNUMERO + 2
        case EMSGSIZE:
            return "Message too long";
#endif
#if ENOBUFS == RCONLINK_HAUSNUMERO + 3
        case ENOBUFS:
            return "No buffer space available";
#endif
        default:
            return strerror (errno_);
    }
}

void rconlink::rconlink_abort (const char *errmsg_)
{
    LIBRCONLINK_UNUSED (errmsg_);
    abort ();
}

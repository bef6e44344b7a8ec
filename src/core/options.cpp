/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include <string.h>

#include "core/options.hpp"
#include "utils/err.hpp"

static int sockopt_invalid ()
{
    errno = EINVAL;
    return -1;
}

int rconlink::do_getsockopt (void *const optval_,
                             size_t *const optvallen_,
                             const void *value_,
                             const size_t value_len_)
{
    if (!optval_ || !optvallen_ || *optvallen_ < value_len_) {
        return sockopt_invalid ();
    }
    memcpy (optval_, value_, value_len_);
    memset (static_cast<char *> (optval_) + value_len_, 0,
            *optvallen_ - value_len_);
    *optvallen_ = value_len_;
    return 0;
}

//  Socket read size for rcon_stream_t. Not exposed through the C API, whose
//  decoders never read from a socket.
static const int read_bufsize_dflt = 8192;

template <typename T>
static int do_setsockopt (const void *const optval_,
                          const size_t optvallen_,
                          T *const out_value_)
{
    if (optval_ && optvallen_ == sizeof (T)) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return sockopt_invalid ();
}

rconlink::options_t::options_t () :
    max_pending (RCONLINK_MAXPENDING_DFLT),
    read_bufsize (read_bufsize_dflt)
{
}

int rconlink::options_t::setopt (int option_,
                                 const void *optval_,
                                 size_t optvallen_)
{
    switch (option_) {
        case RCONLINK_MAXPENDING: {
            int64_t value = 0;
            if (do_setsockopt (optval_, optvallen_, &value) == -1)
                return -1;
            if (value < -1)
                return sockopt_invalid ();
            max_pending = value;
            return 0;
        }

        default:
            break;
    }
    return sockopt_invalid ();
}

int rconlink::options_t::getopt (int option_,
                                 void *optval_,
                                 size_t *optvallen_) const
{
    switch (option_) {
        case RCONLINK_MAXPENDING:
            return do_getsockopt (optval_, optvallen_, &max_pending,
                                  sizeof (max_pending));

        default:
            break;
    }
    return sockopt_invalid ();
}

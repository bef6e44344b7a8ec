/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_OPTIONS_HPP_INCLUDED__
#define __RCONLINK_OPTIONS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace rconlink
{
struct options_t
{
    options_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Maximum bytes buffered without forming a frame, -1 for no limit.
    int64_t max_pending;

    //  Size of a single socket read by rcon_stream_t. Set directly, there is
    //  no setopt id for it.
    int read_bufsize;
};

int do_getsockopt (void *optval_,
                   size_t *optvallen_,
                   const void *value_,
                   size_t value_len_);
}

#endif

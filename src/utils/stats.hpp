/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_STATS_HPP_INCLUDED__
#define __RCONLINK_STATS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace rconlink
{
//  Process-wide decoder statistics. Collected only when the environment
//  variable RCONLINK_DECODER_STATS is set to a non-zero value, and dumped
//  to stderr at exit.
bool decoder_stats_enabled ();

void decoder_stats_add_fed (size_t bytes_);
void decoder_stats_inc_frames ();
void decoder_stats_inc_dropped ();
void decoder_stats_add_discarded (size_t bytes_);
void decoder_stats_inc_stalls ();

struct decoder_stats_t
{
    uint64_t feed_calls;
    uint64_t fed_bytes;
    uint64_t frames;
    uint64_t dropped;
    uint64_t discards;
    uint64_t discarded_bytes;
    uint64_t stalls;
};

//  Snapshot of the current counters. All zero when collection is disabled.
void decoder_stats_snapshot (decoder_stats_t *out_);
}

#endif

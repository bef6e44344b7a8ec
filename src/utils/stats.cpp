/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/stats.hpp"
#include "utils/debug.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace rconlink
{
namespace
{
std::atomic<uint64_t> decoder_feed_calls (0);
std::atomic<uint64_t> decoder_fed_bytes (0);
std::atomic<uint64_t> decoder_frames (0);
std::atomic<uint64_t> decoder_dropped (0);
std::atomic<uint64_t> decoder_discards (0);
std::atomic<uint64_t> decoder_discarded_bytes (0);
std::atomic<uint64_t> decoder_stalls (0);
std::atomic<bool> decoder_stats_registered (false);

void decoder_stats_dump ()
{
    std::fprintf (stderr,
                  "[RCON_DECODER_STATS] feed calls=%llu bytes=%llu\n"
                  "[RCON_DECODER_STATS] frames=%llu dropped=%llu\n"
                  "[RCON_DECODER_STATS] discards=%llu discarded_bytes=%llu "
                  "stalls=%llu\n",
                  static_cast<unsigned long long> (decoder_feed_calls.load ()),
                  static_cast<unsigned long long> (decoder_fed_bytes.load ()),
                  static_cast<unsigned long long> (decoder_frames.load ()),
                  static_cast<unsigned long long> (decoder_dropped.load ()),
                  static_cast<unsigned long long> (decoder_discards.load ()),
                  static_cast<unsigned long long> (
                    decoder_discarded_bytes.load ()),
                  static_cast<unsigned long long> (decoder_stalls.load ()));
}

void decoder_stats_maybe_register ()
{
    bool expected = false;
    if (decoder_stats_registered.compare_exchange_strong (expected, true)) {
        RCON_DBG ("STATS", "decoder statistics enabled, dumped at exit");
        std::atexit (decoder_stats_dump);
    }
}
}

bool decoder_stats_enabled ()
{
    static int enabled = -1;
    if (enabled == -1) {
        const char *env = std::getenv ("RCONLINK_DECODER_STATS");
        enabled = (env && *env && *env != '0') ? 1 : 0;
    }
    return enabled == 1;
}

void decoder_stats_add_fed (size_t bytes_)
{
    if (!decoder_stats_enabled ())
        return;
    decoder_stats_maybe_register ();
    ++decoder_feed_calls;
    decoder_fed_bytes += bytes_;
}

void decoder_stats_inc_frames ()
{
    if (decoder_stats_enabled ())
        ++decoder_frames;
}

void decoder_stats_inc_dropped ()
{
    if (decoder_stats_enabled ())
        ++decoder_dropped;
}

void decoder_stats_add_discarded (size_t bytes_)
{
    if (!decoder_stats_enabled ())
        return;
    ++decoder_discards;
    decoder_discarded_bytes += bytes_;
}

void decoder_stats_inc_stalls ()
{
    if (decoder_stats_enabled ())
        ++decoder_stalls;
}

void decoder_stats_snapshot (decoder_stats_t *out_)
{
    out_->feed_calls = decoder_feed_calls.load ();
    out_->fed_bytes = decoder_fed_bytes.load ();
    out_->frames = decoder_frames.load ();
    out_->dropped = decoder_dropped.load ();
    out_->discards = decoder_discards.load ();
    out_->discarded_bytes = decoder_discarded_bytes.load ();
    out_->stalls = decoder_stalls.load ();
}
}

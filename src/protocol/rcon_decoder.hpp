/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_RCON_DECODER_HPP_INCLUDED__
#define __RCONLINK_RCON_DECODER_HPP_INCLUDED__

#include "protocol/rcon_protocol.hpp"
#include "protocol/response.hpp"
#include "utils/macros.hpp"

#include <vector>

namespace rconlink
{
//  Incremental decoder for Source RCON response frames.
//
//  One instance belongs to one connection. Bytes accumulate across feed ()
//  calls; every complete frame that passes validation is emitted, and the
//  bytes of an incomplete trailing frame stay buffered for the next call.
//  A frame that fails validation is treated as not yet complete, except a
//  split-response terminator (id 999) with non-zero terminator bytes, which
//  drops everything buffered.
//
//  Bodies are the server's UTF-8 text, kept as the raw bytes received.
//  Invalid sequences are passed through unchanged, not replaced.
class rcon_decoder_t
{
  public:
    //  max_pending_ bounds the bytes that may stay buffered without forming
    //  a frame, -1 disables the bound.
    explicit rcon_decoder_t (int64_t max_pending_ = rcon_default_max_pending);
    ~rcon_decoder_t ();

    //  Appends size_ bytes and decodes every complete frame into out_, in
    //  stream order. Returns the number of frames appended. Returns -1 with
    //  errno set to EMSGSIZE when the leftover bytes exceed the pending
    //  bound; the buffer is dropped and frames decoded before the check are
    //  still in out_.
    int
    feed (const unsigned char *data_, size_t size_, std::vector<response_t> *out_);

    //  Drops buffered bytes, error state and counters.
    void reset ();

    void set_max_pending (int64_t max_pending_) { _max_pending = max_pending_; }

    size_t pending () const { return _buf.size () - _pos; }
    uint8_t error_code () const { return _error_code; }

    //  Decode attempts since the last completed frame.
    uint64_t attempts () const { return _attempts; }

    uint64_t frames () const { return _frames; }
    uint64_t dropped () const { return _dropped; }
    uint64_t discards () const { return _discards; }
    uint64_t discarded_bytes () const { return _discarded_bytes; }

  private:
    enum attempt_t
    {
        attempt_need_more,
        attempt_frame,
        attempt_dropped,
        attempt_discarded
    };

    attempt_t decode_one (response_t *response_);
    void discard_all ();
    void compact ();

    //  Accumulation buffer and read offset. Bytes before _pos belong to
    //  frames already consumed and are compacted out after each feed.
    std::vector<unsigned char> _buf;
    size_t _pos;

    int64_t _max_pending;
    uint8_t _error_code;

    uint64_t _attempts;
    uint64_t _frames;
    uint64_t _dropped;
    uint64_t _discards;
    uint64_t _discarded_bytes;

    RCONLINK_NON_COPYABLE_NOR_MOVABLE (rcon_decoder_t)
};
}

#endif

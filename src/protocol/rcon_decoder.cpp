/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/rcon_decoder.hpp"
#include "protocol/wire.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/stats.hpp"

#include <ctype.h>
#include <string.h>

namespace
{
bool is_blank (const std::string &body_)
{
    for (size_t i = 0; i < body_.size (); ++i)
        if (!isspace (static_cast<unsigned char> (body_[i])))
            return false;
    return true;
}
}

rconlink::rcon_decoder_t::rcon_decoder_t (int64_t max_pending_) :
    _pos (0),
    _max_pending (max_pending_),
    _error_code (rcon_error_none),
    _attempts (0),
    _frames (0),
    _dropped (0),
    _discards (0),
    _discarded_bytes (0)
{
}

rconlink::rcon_decoder_t::~rcon_decoder_t ()
{
}

int rconlink::rcon_decoder_t::feed (const unsigned char *data_,
                                    size_t size_,
                                    std::vector<response_t> *out_)
{
    rconlink_assert (out_);
    rconlink_assert (data_ || size_ == 0);

    decoder_stats_add_fed (size_);
    if (size_ > 0)
        _buf.insert (_buf.end (), data_, data_ + size_);
    _error_code = rcon_error_none;

    int decoded = 0;
    for (;;) {
        response_t response;
        const attempt_t rc = decode_one (&response);
        if (rc == attempt_need_more)
            break;
        if (rc == attempt_frame) {
            out_->push_back (response);
            ++decoded;
        }
    }

    compact ();

    if (_max_pending >= 0 && _buf.size () > static_cast<uint64_t> (_max_pending)) {
        RCON_LOG_WARN ("dropping %zu pending bytes, limit is %lld",
                       _buf.size (), static_cast<long long> (_max_pending));
        _buf.clear ();
        _pos = 0;
        _error_code = rcon_error_stalled;
        decoder_stats_inc_stalls ();
        errno = EMSGSIZE;
        return -1;
    }

    return decoded;
}

rconlink::rcon_decoder_t::attempt_t
rconlink::rcon_decoder_t::decode_one (response_t *response_)
{
    ++_attempts;
    const size_t readable = _buf.size () - _pos;
    RCON_DBG_DECODER ("(%llu) decoding: readable bytes = %zu%s",
                      static_cast<unsigned long long> (_attempts), readable,
                      _attempts > 1 ? " [continuation]" : "");

    if (readable < rcon_min_frame_size) {
        RCON_DBG_DECODER ("[ ] minimum size = NO (readable %zu)", readable);
        return attempt_need_more;
    }

    //  Fields are read from a local cursor. Returning without touching _pos
    //  is the rollback to the mark.
    const size_t mark = _pos;
    const unsigned char *const data = &_buf[0];
    size_t cursor = mark;

    const int32_t size = get_int32_le (data + cursor);
    cursor += rcon_size_field;
    if (static_cast<int64_t> (_buf.size () - cursor)
        < static_cast<int64_t> (size)) {
        RCON_DBG_DECODER ("[ ] declared size fits = NO (declared %d, "
                          "readable %zu)",
                          size, _buf.size () - cursor);
        return attempt_need_more;
    }

    const int32_t id = get_int32_le (data + cursor);
    cursor += 4;
    if (!is_valid_id (id)) {
        RCON_DBG_DECODER ("[ ] request id in range = NO (actual %d)", id);
        return attempt_need_more;
    }

    const int32_t type = get_int32_le (data + cursor);
    cursor += 4;
    response_type_t tag;
    if (!resolve_type (type, &tag)) {
        RCON_DBG_DECODER ("[ ] valid response type = NO (actual %d)", type);
        return attempt_need_more;
    }

    //  The body ends at the first zero byte inside the declared frame. With
    //  no zero byte there, the body is empty and the byte at the cursor is
    //  taken as the body terminator.
    size_t body_end = cursor;
    if (size > 8) {
        const size_t frame_end = mark + rcon_size_field
                                 + static_cast<size_t> (size);
        const void *zero =
          memchr (data + cursor, 0, frame_end - cursor);
        if (zero)
            body_end = static_cast<const unsigned char *> (zero) - data;
    }
    const size_t body_length = body_end - cursor;

    if (body_end + 1 >= _buf.size ()) {
        RCON_DBG_DECODER ("[ ] packet terminator present = NO");
        return attempt_need_more;
    }

    const unsigned char body_terminator = data[body_end];
    const unsigned char packet_terminator = data[body_end + 1];
    if (body_terminator != 0 || packet_terminator != 0) {
        if (id == rcon_id_terminator) {
            RCON_LOG_WARN ("malformed terminator packet, skipping the "
                           "remaining %zu bytes",
                           _buf.size () - _pos);
            discard_all ();
            return attempt_discarded;
        }
        RCON_DBG_DECODER ("[ ] two null terminators = NO (body %u, "
                          "packet %u)",
                          body_terminator, packet_terminator);
        return attempt_need_more;
    }

    std::string body (reinterpret_cast<const char *> (data + cursor),
                      body_length);
    _pos = body_end + 2;
    _attempts = 0;

    RCON_DBG_DECODER ("[x] PASS (size %d, id %d, type %d, body %zu bytes, "
                      "remaining %zu)",
                      size, id, type, body_length, _buf.size () - _pos);

    if (id == rcon_id_terminator && is_blank (body)) {
        make_terminator_response (response_);
    } else if (make_response (tag, response_) == -1) {
        //  resolve_type () and the response table list the same codes, so
        //  this only fires if one is extended without the other.
        RCON_LOG_ERROR ("no response variant for type %d, frame dropped",
                        type);
        ++_dropped;
        decoder_stats_inc_dropped ();
        return attempt_dropped;
    }

    response_->size = size;
    response_->id = id;
    response_->type = type;
    response_->body.swap (body);

    ++_frames;
    decoder_stats_inc_frames ();
    return attempt_frame;
}

void rconlink::rcon_decoder_t::discard_all ()
{
    const size_t skipped = _buf.size () - _pos;
    _buf.clear ();
    _pos = 0;
    _error_code = rcon_error_malformed_terminator;
    ++_discards;
    _discarded_bytes += skipped;
    decoder_stats_add_discarded (skipped);
}

void rconlink::rcon_decoder_t::compact ()
{
    if (_pos == 0)
        return;
    _buf.erase (_buf.begin (), _buf.begin () + _pos);
    _pos = 0;
}

void rconlink::rcon_decoder_t::reset ()
{
    _buf.clear ();
    _pos = 0;
    _error_code = rcon_error_none;
    _attempts = 0;
    _frames = 0;
    _dropped = 0;
    _discards = 0;
    _discarded_bytes = 0;
}

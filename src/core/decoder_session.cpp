/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/decoder_session.hpp"
#include "utils/err.hpp"

namespace rconlink
{
static const uint32_t decoder_session_tag_value = 0x2c0d3c0d;

decoder_session_t::decoder_session_t () :
    _tag (decoder_session_tag_value), _decoder (_options.max_pending)
{
}

decoder_session_t::~decoder_session_t ()
{
    _tag = 0xdeadbeef;
}

bool decoder_session_t::check_tag () const
{
    return _tag == decoder_session_tag_value;
}

int decoder_session_t::setopt (int option_,
                               const void *optval_,
                               size_t optvallen_)
{
    const int rc = _options.setopt (option_, optval_, optvallen_);
    if (rc == 0 && option_ == RCONLINK_MAXPENDING)
        _decoder.set_max_pending (_options.max_pending);
    return rc;
}

int decoder_session_t::getopt (int option_,
                               void *optval_,
                               size_t *optvallen_) const
{
    switch (option_) {
        case RCONLINK_PENDING: {
            const uint64_t value = _decoder.pending ();
            return do_getsockopt (optval_, optvallen_, &value,
                                  sizeof (value));
        }

        case RCONLINK_DISCARDED: {
            const uint64_t value = _decoder.discarded_bytes ();
            return do_getsockopt (optval_, optvallen_, &value,
                                  sizeof (value));
        }

        case RCONLINK_LAST_ERROR: {
            const int value = _decoder.error_code ();
            return do_getsockopt (optval_, optvallen_, &value,
                                  sizeof (value));
        }

        default:
            return _options.getopt (option_, optval_, optvallen_);
    }
}

int decoder_session_t::feed (const unsigned char *data_, size_t size_)
{
    _decoded.clear ();
    const int rc = _decoder.feed (data_, size_, &_decoded);
    const int err = errno;
    _queue.insert (_queue.end (), _decoded.begin (), _decoded.end ());
    _decoded.clear ();
    if (rc == -1) {
        errno = err;
        return -1;
    }
    return static_cast<int> (_queue.size ());
}

int decoder_session_t::recv (response_t *response_)
{
    rconlink_assert (response_);

    if (_queue.empty ()) {
        errno = EAGAIN;
        return -1;
    }
    *response_ = _queue.front ();
    _queue.pop_front ();
    return 0;
}
}

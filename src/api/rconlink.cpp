/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include <string.h>
#include <stdlib.h>
#include <new>
#include <string>
#include <vector>

#include "core/decoder_session.hpp"
#include "protocol/rcon_encoder.hpp"
#include "protocol/response.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

static inline rconlink::decoder_session_t *as_decoder_session (void *d_)
{
    if (!d_) {
        errno = EFAULT;
        return NULL;
    }

    rconlink::decoder_session_t *d =
      static_cast<rconlink::decoder_session_t *> (d_);
    if (!d->check_tag ()) {
        errno = EFAULT;
        return NULL;
    }
    return d;
}

void rconlink_version (int *major_, int *minor_, int *patch_)
{
    *major_ = RCONLINK_VERSION_MAJOR;
    *minor_ = RCONLINK_VERSION_MINOR;
    *patch_ = RCONLINK_VERSION_PATCH;
}

const char *rconlink_strerror (int errnum_)
{
    return rconlink::errno_to_string (errnum_);
}

int rconlink_errno (void)
{
    return errno;
}

//  Frames

int rconlink_frame_close (rconlink_frame_t *frame_)
{
    if (!frame_) {
        errno = EFAULT;
        return -1;
    }
    free (frame_->body);
    memset (frame_, 0, sizeof (*frame_));
    return 0;
}

//  Decoder

void *rconlink_decoder_new (void)
{
    rconlink::decoder_session_t *d =
      new (std::nothrow) rconlink::decoder_session_t;
    if (!d) {
        errno = ENOMEM;
        return NULL;
    }
    return d;
}

int rconlink_decoder_close (void *decoder_)
{
    rconlink::decoder_session_t *d = as_decoder_session (decoder_);
    if (!d)
        return -1;
    delete d;
    return 0;
}

int rconlink_decoder_setopt (void *decoder_,
                             int option_,
                             const void *optval_,
                             size_t optvallen_)
{
    rconlink::decoder_session_t *d = as_decoder_session (decoder_);
    if (!d)
        return -1;
    return d->setopt (option_, optval_, optvallen_);
}

int rconlink_decoder_getopt (void *decoder_,
                             int option_,
                             void *optval_,
                             size_t *optvallen_)
{
    rconlink::decoder_session_t *d = as_decoder_session (decoder_);
    if (!d)
        return -1;
    return d->getopt (option_, optval_, optvallen_);
}

int rconlink_decoder_feed (void *decoder_, const void *data_, size_t size_)
{
    rconlink::decoder_session_t *d = as_decoder_session (decoder_);
    if (!d)
        return -1;
    if (!data_ && size_ > 0) {
        errno = EINVAL;
        return -1;
    }
    return d->feed (static_cast<const unsigned char *> (data_), size_);
}

int rconlink_decoder_recv (void *decoder_, rconlink_frame_t *frame_)
{
    rconlink::decoder_session_t *d = as_decoder_session (decoder_);
    if (!d)
        return -1;
    if (!frame_) {
        errno = EFAULT;
        return -1;
    }

    rconlink::response_t response;
    if (d->recv (&response) == -1)
        return -1;

    char *body = static_cast<char *> (malloc (response.body.size () + 1));
    alloc_assert (body);
    if (!response.body.empty ())
        memcpy (body, response.body.data (), response.body.size ());
    body[response.body.size ()] = '\0';

    frame_->size = response.size;
    frame_->id = response.id;
    frame_->type = response.type;
    frame_->kind = static_cast<int> (response.kind);
    frame_->body = body;
    frame_->body_size = response.body.size ();
    return 0;
}

//  Encoding

int rconlink_encode (int32_t id_,
                     int32_t type_,
                     const char *body_,
                     size_t body_size_,
                     void *buf_,
                     size_t buf_size_)
{
    if ((!body_ && body_size_ > 0) || !buf_) {
        errno = EINVAL;
        return -1;
    }
    std::vector<unsigned char> packet;
    const std::string body =
      body_size_ > 0 ? std::string (body_, body_size_) : std::string ();
    const int rc = rconlink::encode_packet (id_, type_, body, &packet);
    if (rc == -1)
        return -1;
    if (buf_size_ < packet.size ()) {
        errno = ENOBUFS;
        return -1;
    }
    memcpy (buf_, &packet[0], packet.size ());
    return rc;
}

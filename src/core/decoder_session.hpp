/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_DECODER_SESSION_HPP_INCLUDED__
#define __RCONLINK_DECODER_SESSION_HPP_INCLUDED__

#include "core/options.hpp"
#include "protocol/rcon_decoder.hpp"
#include "protocol/response.hpp"
#include "utils/macros.hpp"

#include <deque>
#include <vector>

namespace rconlink
{
//  Object behind the void * handle returned by rconlink_decoder_new ().
//  Couples a decoder with its options and the queue of frames not yet
//  picked up by rconlink_decoder_recv ().
class decoder_session_t
{
  public:
    decoder_session_t ();
    ~decoder_session_t ();

    bool check_tag () const;

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Returns the number of queued frames, or -1 on decoder error.
    int feed (const unsigned char *data_, size_t size_);

    //  Moves the oldest queued frame into response_. Returns -1 with errno
    //  set to EAGAIN when the queue is empty.
    int recv (response_t *response_);


  private:
    uint32_t _tag;
    options_t _options;
    rcon_decoder_t _decoder;
    std::deque<response_t> _queue;
    std::vector<response_t> _decoded;

    RCONLINK_NON_COPYABLE_NOR_MOVABLE (decoder_session_t)
};
}

#endif

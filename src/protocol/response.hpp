/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_RESPONSE_HPP_INCLUDED__
#define __RCONLINK_RESPONSE_HPP_INCLUDED__

#include "protocol/rcon_protocol.hpp"

#include <string>

namespace rconlink
{
enum response_kind_t
{
    response_terminator = 1,
    response_auth = 2,
    response_command = 3
};

const char *response_kind_name (response_kind_t kind_);

//  One decoded RCON response frame.
struct response_t
{
    response_t ();

    bool is_terminator () const { return kind == response_terminator; }

    response_kind_t kind;
    int32_t size;
    int32_t id;
    int32_t type;
    std::string body;
};

//  Initializes response_ as the empty variant registered for tag_.
//  Returns -1 with errno set to EPROTO if no variant is registered.
int make_response (response_type_t tag_, response_t *response_);

//  Initializes response_ as the split-response terminator variant.
void make_terminator_response (response_t *response_);
}

#endif

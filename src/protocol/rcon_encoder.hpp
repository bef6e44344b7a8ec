/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_RCON_ENCODER_HPP_INCLUDED__
#define __RCONLINK_RCON_ENCODER_HPP_INCLUDED__

#include "protocol/rcon_protocol.hpp"

#include <string>
#include <vector>

namespace rconlink
{
//  Serializers for outbound RCON packets. Each appends one packet to out_
//  and returns its length, or -1 with errno set to EINVAL when the body
//  holds a zero byte, or EMSGSIZE when it exceeds rcon_max_body_size.

int encode_packet (int32_t id_,
                   int32_t type_,
                   const std::string &body_,
                   std::vector<unsigned char> *out_);

int encode_auth (int32_t id_,
                 const std::string &password_,
                 std::vector<unsigned char> *out_);

int encode_command (int32_t id_,
                    const std::string &command_,
                    std::vector<unsigned char> *out_);

//  Empty RESPONSE_VALUE request with the reserved id. Servers mirror it
//  back after the last packet of a split response.
int encode_terminator (std::vector<unsigned char> *out_);

//  Number of bytes encode_packet () produces for a body of body_size_.
inline size_t encoded_size (size_t body_size_)
{
    return rcon_min_frame_size + body_size_;
}
}

#endif

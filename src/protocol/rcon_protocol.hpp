/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_RCON_PROTOCOL_HPP_INCLUDED__
#define __RCONLINK_RCON_PROTOCOL_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace rconlink
{
//  Source RCON packet layout, all integers little-endian signed 32-bit:
//
//    [size][id][type][body ...][0x00][0x00]
//
//  size counts everything after the size field itself.

const size_t rcon_size_field = 4;
const size_t rcon_header_size = 12;

//  size + id + type + empty body terminator + packet terminator.
const size_t rcon_min_frame_size = 14;

//  Largest value the size field carries for packets we produce.
const size_t rcon_max_packet_size = 4096;
const size_t rcon_max_body_size = rcon_max_packet_size - 10;

//  Request ids
const int32_t rcon_id_unsolicited = -1;
const int32_t rcon_id_terminator = 999;
const int32_t rcon_id_min = 100000000;
const int32_t rcon_id_max = 999999999;

//  Response type codes
const int32_t rcon_type_response_value = 0;
const int32_t rcon_type_auth_response = 2;

//  Request type codes
const int32_t rcon_type_execcommand = 2;
const int32_t rcon_type_auth = 3;

//  Resolved response type
enum response_type_t
{
    response_type_value = 0,
    response_type_auth = 1
};

//  Decoder error codes
const uint8_t rcon_error_none = 0x00;
const uint8_t rcon_error_malformed_terminator = 0x01;
const uint8_t rcon_error_stalled = 0x02;

const int64_t rcon_default_max_pending = 65536;

inline const char *rcon_error_reason (uint8_t code_)
{
    switch (code_) {
        case rcon_error_none:
            return "no error";
        case rcon_error_malformed_terminator:
            return "malformed terminator packet";
        case rcon_error_stalled:
            return "pending bytes limit exceeded";
        default:
            return "unknown error";
    }
}

//  True for the unsolicited id, the split-response terminator id and the
//  nine digit correlation ids.
bool is_valid_id (int32_t id_);

//  Maps a response type code to its tag. Returns false for unknown codes.
bool resolve_type (int32_t code_, response_type_t *tag_);
}

#endif

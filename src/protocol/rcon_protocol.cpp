/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/rcon_protocol.hpp"

bool rconlink::is_valid_id (int32_t id_)
{
    if (id_ == rcon_id_unsolicited || id_ == rcon_id_terminator)
        return true;
    return id_ >= rcon_id_min && id_ <= rcon_id_max;
}

bool rconlink::resolve_type (int32_t code_, response_type_t *tag_)
{
    switch (code_) {
        case rcon_type_response_value:
            *tag_ = response_type_value;
            return true;
        case rcon_type_auth_response:
            *tag_ = response_type_auth;
            return true;
        default:
            return false;
    }
}

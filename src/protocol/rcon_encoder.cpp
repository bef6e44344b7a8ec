/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/rcon_encoder.hpp"
#include "protocol/wire.hpp"
#include "utils/err.hpp"

int rconlink::encode_packet (int32_t id_,
                             int32_t type_,
                             const std::string &body_,
                             std::vector<unsigned char> *out_)
{
    rconlink_assert (out_);

    if (body_.find ('\0') != std::string::npos) {
        errno = EINVAL;
        return -1;
    }
    if (body_.size () > rcon_max_body_size) {
        errno = EMSGSIZE;
        return -1;
    }

    const size_t length = encoded_size (body_.size ());
    const size_t offset = out_->size ();
    out_->resize (offset + length, 0);

    unsigned char *ptr = &(*out_)[offset];
    put_int32_le (ptr, static_cast<int32_t> (length - rcon_size_field));
    put_int32_le (ptr + 4, id_);
    put_int32_le (ptr + 8, type_);
    if (!body_.empty ())
        memcpy (ptr + rcon_header_size, body_.data (), body_.size ());
    //  Both trailing zero bytes come from the resize.

    return static_cast<int> (length);
}

int rconlink::encode_auth (int32_t id_,
                           const std::string &password_,
                           std::vector<unsigned char> *out_)
{
    return encode_packet (id_, rcon_type_auth, password_, out_);
}

int rconlink::encode_command (int32_t id_,
                              const std::string &command_,
                              std::vector<unsigned char> *out_)
{
    return encode_packet (id_, rcon_type_execcommand, command_, out_);
}

int rconlink::encode_terminator (std::vector<unsigned char> *out_)
{
    return encode_packet (rcon_id_terminator, rcon_type_response_value,
                          std::string (), out_);
}

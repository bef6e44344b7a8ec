/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_WIRE_HPP_INCLUDED__
#define __RCONLINK_WIRE_HPP_INCLUDED__

#include <stdint.h>

namespace rconlink
{
//  Helper functions to convert different integer types to/from the
//  little-endian byte order used on the RCON wire.

inline void put_uint32_le (unsigned char *buffer_, uint32_t value_)
{
    buffer_[0] = static_cast<unsigned char> (value_ & 0xff);
    buffer_[1] = static_cast<unsigned char> ((value_ >> 8) & 0xff);
    buffer_[2] = static_cast<unsigned char> ((value_ >> 16) & 0xff);
    buffer_[3] = static_cast<unsigned char> ((value_ >> 24) & 0xff);
}

inline uint32_t get_uint32_le (const unsigned char *buffer_)
{
    return (static_cast<uint32_t> (buffer_[0]))
           | (static_cast<uint32_t> (buffer_[1]) << 8)
           | (static_cast<uint32_t> (buffer_[2]) << 16)
           | (static_cast<uint32_t> (buffer_[3]) << 24);
}

inline void put_int32_le (unsigned char *buffer_, int32_t value_)
{
    put_uint32_le (buffer_, static_cast<uint32_t> (value_));
}

inline int32_t get_int32_le (const unsigned char *buffer_)
{
    return static_cast<int32_t> (get_uint32_le (buffer_));
}
}

#endif

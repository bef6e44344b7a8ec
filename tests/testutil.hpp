/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_HPP_INCLUDED__
#define __TESTUTIL_HPP_INCLUDED__

#include "../include/rconlink.h"

#include <unity.h>

#include <errno.h>
#include <stdio.h>
#include <stdint.h>
#include <string.h>
#include <string>
#include <vector>

#if !defined _WIN32
#include <unistd.h>
#endif

//  Asserts that an errno-style call succeeded, reporting errno otherwise.
#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    do {                                                                       \
        const int _rc = (expr);                                                \
        if (_rc == -1) {                                                       \
            char _msg[256];                                                    \
            snprintf (_msg, sizeof _msg, "%s failed, errno = %i (%s)", #expr,  \
                      errno, rconlink_strerror (errno));                       \
            TEST_FAIL_MESSAGE (_msg);                                          \
        }                                                                      \
    } while (0)

//  Asserts that an errno-style call failed with the given errno.
#define TEST_ASSERT_FAILURE_ERRNO(error_code, expr)                            \
    do {                                                                       \
        const int _rc = (expr);                                                \
        TEST_ASSERT_EQUAL_INT (-1, _rc);                                       \
        TEST_ASSERT_EQUAL_INT (error_code, errno);                             \
    } while (0)

inline void setup_test_environment (int timeout_seconds_ = 60)
{
#if !defined _WIN32
    //  Abort hung tests.
    alarm (timeout_seconds_);
#endif
}

inline void put_test_int32 (std::vector<unsigned char> &buf_, int32_t value_)
{
    const uint32_t v = static_cast<uint32_t> (value_);
    buf_.push_back (static_cast<unsigned char> (v & 0xff));
    buf_.push_back (static_cast<unsigned char> ((v >> 8) & 0xff));
    buf_.push_back (static_cast<unsigned char> ((v >> 16) & 0xff));
    buf_.push_back (static_cast<unsigned char> ((v >> 24) & 0xff));
}

//  Appends a frame with explicit size field and terminator bytes, so tests
//  can produce malformed packets.
inline void append_raw_frame (std::vector<unsigned char> &buf_,
                              int32_t size_,
                              int32_t id_,
                              int32_t type_,
                              const std::string &body_,
                              unsigned char body_terminator_,
                              unsigned char packet_terminator_)
{
    put_test_int32 (buf_, size_);
    put_test_int32 (buf_, id_);
    put_test_int32 (buf_, type_);
    buf_.insert (buf_.end (), body_.begin (), body_.end ());
    buf_.push_back (body_terminator_);
    buf_.push_back (packet_terminator_);
}

//  Appends a well-formed frame: size counts id, type, body and both
//  terminators.
inline void append_frame (std::vector<unsigned char> &buf_,
                          int32_t id_,
                          int32_t type_,
                          const std::string &body_)
{
    append_raw_frame (buf_, static_cast<int32_t> (10 + body_.size ()), id_,
                      type_, body_, 0, 0);
}

#endif

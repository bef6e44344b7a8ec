/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/rcon_decoder.hpp"
#include "protocol/rcon_protocol.hpp"
#include "protocol/response.hpp"
#include "utils/stats.hpp"

#include <unity.h>
#include <stdlib.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static void feed_bytes (rconlink::rcon_decoder_t &decoder_,
                        const std::vector<unsigned char> &buf_,
                        size_t size_,
                        std::vector<rconlink::response_t> *out_,
                        int expected_rc_)
{
    TEST_ASSERT_EQUAL_INT (expected_rc_,
                           decoder_.feed (&buf_[0], size_, out_));
}

void test_stats_enabled_from_environment ()
{
    TEST_ASSERT_TRUE (rconlink::decoder_stats_enabled ());
}

void test_stats_count_decoder_events ()
{
    rconlink::decoder_stats_t before;
    rconlink::decoder_stats_snapshot (&before);

    rconlink::rcon_decoder_t decoder (32);
    std::vector<rconlink::response_t> out;

    std::vector<unsigned char> good;
    append_frame (good, 100000001, rconlink::rcon_type_response_value, "ok");
    feed_bytes (decoder, good, good.size (), &out, 1);

    //  Reserved id with non-zero terminators: everything buffered goes.
    std::vector<unsigned char> malformed;
    append_raw_frame (malformed, 11, rconlink::rcon_id_terminator,
                      rconlink::rcon_type_response_value, "x", 'a', 'b');
    feed_bytes (decoder, malformed, malformed.size (), &out, 0);
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_error_malformed_terminator,
                           decoder.error_code ());

    //  40 bytes of a 78-byte frame exceed the 32-byte pending bound.
    std::vector<unsigned char> large;
    append_frame (large, 100000002, rconlink::rcon_type_response_value,
                  std::string (64, 'l'));
    errno = 0;
    feed_bytes (decoder, large, 40, &out, -1);
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);

    rconlink::decoder_stats_t after;
    rconlink::decoder_stats_snapshot (&after);

    TEST_ASSERT_EQUAL_INT (
      3, static_cast<int> (after.feed_calls - before.feed_calls));
    TEST_ASSERT_EQUAL_INT (
      static_cast<int> (good.size () + malformed.size () + 40),
      static_cast<int> (after.fed_bytes - before.fed_bytes));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (after.frames - before.frames));
    TEST_ASSERT_EQUAL_INT (
      0, static_cast<int> (after.dropped - before.dropped));
    TEST_ASSERT_EQUAL_INT (
      1, static_cast<int> (after.discards - before.discards));
    TEST_ASSERT_EQUAL_INT (
      static_cast<int> (malformed.size ()),
      static_cast<int> (after.discarded_bytes - before.discarded_bytes));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (after.stalls - before.stalls));
}

int main ()
{
    //  Collection is decided on first use, so the variable must be set
    //  before any decoder runs.
#if defined _WIN32
    _putenv_s ("RCONLINK_DECODER_STATS", "1");
#else
    setenv ("RCONLINK_DECODER_STATS", "1", 1);
#endif

    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_stats_enabled_from_environment);
    RUN_TEST (test_stats_count_decoder_events);

    return UNITY_END ();
}

/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/rcon_decoder.hpp"
#include "protocol/rcon_protocol.hpp"
#include "protocol/response.hpp"

#include <unity.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static int feed_all (rconlink::rcon_decoder_t &decoder_,
                     const std::vector<unsigned char> &buf_,
                     std::vector<rconlink::response_t> *out_)
{
    return decoder_.feed (buf_.empty () ? NULL : &buf_[0], buf_.size (),
                          out_);
}

void test_decode_single_frame ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, 123456789, rconlink::rcon_type_response_value,
                  "hostname: test");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (1, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (out.size ()));
    TEST_ASSERT_EQUAL_INT (24, out[0].size);
    TEST_ASSERT_EQUAL_INT (123456789, out[0].id);
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_type_response_value, out[0].type);
    TEST_ASSERT_EQUAL_STRING ("hostname: test", out[0].body.c_str ());
    TEST_ASSERT_EQUAL_INT (rconlink::response_command, out[0].kind);
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (decoder.frames ()));
}

void test_decode_byte_at_a_time ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, 100000042, rconlink::rcon_type_response_value,
                  "status\nmap: de_dust2");

    std::vector<rconlink::response_t> out;
    for (size_t i = 0; i + 1 < buf.size (); ++i) {
        TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[i], 1, &out));
        TEST_ASSERT_EQUAL_INT (0, static_cast<int> (out.size ()));
        TEST_ASSERT_EQUAL_INT (static_cast<int> (i + 1),
                               static_cast<int> (decoder.pending ()));
    }

    TEST_ASSERT_EQUAL_INT (1, decoder.feed (&buf[buf.size () - 1], 1, &out));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (out.size ()));
    TEST_ASSERT_EQUAL_INT (100000042, out[0].id);
    TEST_ASSERT_EQUAL_INT (30, out[0].size);
    TEST_ASSERT_EQUAL_STRING ("status\nmap: de_dust2", out[0].body.c_str ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
}

void test_decode_two_frames_single_buffer ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, 200000001, rconlink::rcon_type_response_value, "abc");
    append_frame (buf, 200000002, rconlink::rcon_type_auth_response, "");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (2, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_INT (200000001, out[0].id);
    TEST_ASSERT_EQUAL_STRING ("abc", out[0].body.c_str ());
    TEST_ASSERT_EQUAL_INT (200000002, out[1].id);
    TEST_ASSERT_EQUAL_INT (rconlink::response_auth, out[1].kind);
    TEST_ASSERT_TRUE (out[1].body.empty ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
}

void test_decode_keeps_trailing_partial_frame ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> first;
    append_frame (first, 300000001, rconlink::rcon_type_response_value,
                  "one");
    std::vector<unsigned char> second;
    append_frame (second, 300000002, rconlink::rcon_type_response_value,
                  "two");

    //  First frame plus the first seven bytes of the second one.
    std::vector<unsigned char> chunk (first);
    chunk.insert (chunk.end (), second.begin (), second.begin () + 7);

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (1, feed_all (decoder, chunk, &out));
    TEST_ASSERT_EQUAL_INT (7, static_cast<int> (decoder.pending ()));

    TEST_ASSERT_EQUAL_INT (
      1, decoder.feed (&second[7], second.size () - 7, &out));
    TEST_ASSERT_EQUAL_INT (2, static_cast<int> (out.size ()));
    TEST_ASSERT_EQUAL_STRING ("two", out[1].body.c_str ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
}

void test_below_minimum_size_waits ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, 400000000, rconlink::rcon_type_response_value, "");
    TEST_ASSERT_EQUAL_INT (14, static_cast<int> (buf.size ()));

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[0], 13, &out));
    TEST_ASSERT_EQUAL_INT (13, static_cast<int> (decoder.pending ()));
    TEST_ASSERT_EQUAL_INT (1, decoder.feed (&buf[13], 1, &out));
    TEST_ASSERT_TRUE (out[0].body.empty ());
}

void test_declared_size_exceeds_available ()
{
    rconlink::rcon_decoder_t decoder (-1);

    const std::string body (100, 'x');
    std::vector<unsigned char> buf;
    append_frame (buf, 500000000, rconlink::rcon_type_response_value, body);

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[0], 20, &out));
    TEST_ASSERT_EQUAL_INT (20, static_cast<int> (decoder.pending ()));
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[20], 60, &out));
    TEST_ASSERT_EQUAL_INT (
      1, decoder.feed (&buf[80], buf.size () - 80, &out));
    TEST_ASSERT_EQUAL_INT (100, static_cast<int> (out[0].body.size ()));
}

void test_size_without_packet_terminator ()
{
    //  Some servers leave the trailing zero byte out of the size field.
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_raw_frame (buf, 9 + 4, 600000000,
                      rconlink::rcon_type_response_value, "pong", 0, 0);

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[0], buf.size () - 1, &out));
    TEST_ASSERT_EQUAL_INT (1, decoder.feed (&buf[buf.size () - 1], 1, &out));
    TEST_ASSERT_EQUAL_INT (13, out[0].size);
    TEST_ASSERT_EQUAL_STRING ("pong", out[0].body.c_str ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
}

static bool decodes_with_id (int32_t id_)
{
    rconlink::rcon_decoder_t decoder (-1);
    std::vector<unsigned char> buf;
    append_frame (buf, id_, rconlink::rcon_type_response_value, "body");

    std::vector<rconlink::response_t> out;
    const int rc = feed_all (decoder, buf, &out);
    TEST_ASSERT_TRUE (rc >= 0);
    if (rc == 0) {
        //  A rejected frame is kept whole, waiting for more data.
        TEST_ASSERT_EQUAL_INT (static_cast<int> (buf.size ()),
                               static_cast<int> (decoder.pending ()));
        return false;
    }
    TEST_ASSERT_EQUAL_INT (id_, out[0].id);
    return true;
}

void test_id_boundaries ()
{
    TEST_ASSERT_FALSE (decodes_with_id (99999999));
    TEST_ASSERT_FALSE (decodes_with_id (1000000000));
    TEST_ASSERT_FALSE (decodes_with_id (0));
    TEST_ASSERT_FALSE (decodes_with_id (-2));
    TEST_ASSERT_FALSE (decodes_with_id (998));
    TEST_ASSERT_TRUE (decodes_with_id (100000000));
    TEST_ASSERT_TRUE (decodes_with_id (999999999));
    TEST_ASSERT_TRUE (decodes_with_id (-1));
    TEST_ASSERT_TRUE (decodes_with_id (999));
}

void test_terminator_response ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, 700000000, rconlink::rcon_type_response_value,
                  "part one");
    append_frame (buf, rconlink::rcon_id_terminator,
                  rconlink::rcon_type_response_value, "");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (2, feed_all (decoder, buf, &out));
    TEST_ASSERT_FALSE (out[0].is_terminator ());
    TEST_ASSERT_TRUE (out[1].is_terminator ());
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_id_terminator, out[1].id);
    TEST_ASSERT_EQUAL_INT (10, out[1].size);
}

void test_terminator_id_with_blank_body ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, rconlink::rcon_id_terminator,
                  rconlink::rcon_type_response_value, " \n");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (1, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_INT (rconlink::response_terminator, out[0].kind);
    TEST_ASSERT_EQUAL_STRING (" \n", out[0].body.c_str ());
}

void test_terminator_id_with_body_uses_type ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, rconlink::rcon_id_terminator,
                  rconlink::rcon_type_response_value, "mirror");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (1, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_INT (rconlink::response_command, out[0].kind);
    TEST_ASSERT_EQUAL_STRING ("mirror", out[0].body.c_str ());
}

void test_response_kind_by_type ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, -1, rconlink::rcon_type_auth_response, "");
    append_frame (buf, 800000000, rconlink::rcon_type_response_value, "ok");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (2, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_INT (rconlink::response_auth, out[0].kind);
    TEST_ASSERT_EQUAL_INT (-1, out[0].id);
    TEST_ASSERT_EQUAL_INT (rconlink::response_command, out[1].kind);
}

void test_malformed_terminator_discards_buffer ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_raw_frame (buf, 10, rconlink::rcon_id_terminator,
                      rconlink::rcon_type_response_value, "", 0x01, 0x01);
    append_frame (buf, 900000000, rconlink::rcon_type_response_value,
                  "never seen");
    append_frame (buf, 900000001, rconlink::rcon_type_response_value,
                  "never seen either");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (out.size ()));
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_error_malformed_terminator,
                           decoder.error_code ());
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (decoder.discards ()));
    TEST_ASSERT_EQUAL_INT (static_cast<int> (buf.size ()),
                           static_cast<int> (decoder.discarded_bytes ()));

    //  Decoding resumes from an empty buffer.
    std::vector<unsigned char> next;
    append_frame (next, 900000002, rconlink::rcon_type_response_value, "ok");
    TEST_ASSERT_EQUAL_INT (1, feed_all (decoder, next, &out));
    TEST_ASSERT_EQUAL_STRING ("ok", out[0].body.c_str ());
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_error_none, decoder.error_code ());
}

void test_malformed_terminator_after_valid_frame ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, 910000000, rconlink::rcon_type_response_value, "kept");
    append_raw_frame (buf, 12, rconlink::rcon_id_terminator,
                      rconlink::rcon_type_response_value, "ab", 0x00, 0x07);

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (1, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_STRING ("kept", out[0].body.c_str ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
    TEST_ASSERT_EQUAL_INT (16, static_cast<int> (decoder.discarded_bytes ()));
}

void test_nonzero_terminator_regular_id_waits ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_raw_frame (buf, 13, 920000000, rconlink::rcon_type_response_value,
                      "abc", 0x00, 0x05);

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_INT (static_cast<int> (buf.size ()),
                           static_cast<int> (decoder.pending ()));
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.discards ()));
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_error_none, decoder.error_code ());
}

void test_unknown_type_never_completes ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> bad;
    append_frame (bad, 930000000, 7, "unknown");
    std::vector<unsigned char> good;
    append_frame (good, 930000001, rconlink::rcon_type_response_value, "ok");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, feed_all (decoder, bad, &out));
    for (int i = 0; i < 16; ++i) {
        TEST_ASSERT_EQUAL_INT (0, feed_all (decoder, bad, &out));
        TEST_ASSERT_EQUAL_INT (0, feed_all (decoder, good, &out));
    }
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (out.size ()));
    TEST_ASSERT_EQUAL_INT (
      static_cast<int> (17 * bad.size () + 16 * good.size ()),
      static_cast<int> (decoder.pending ()));
}

void test_pending_limit_reports_stall ()
{
    rconlink::rcon_decoder_t decoder (64);

    std::vector<unsigned char> buf;
    append_frame (buf, 940000000, rconlink::rcon_type_response_value, "ok");
    append_frame (buf, 940000001, 7, std::string (80, 'z'));

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_FAILURE_ERRNO (EMSGSIZE, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (out.size ()));
    TEST_ASSERT_EQUAL_STRING ("ok", out[0].body.c_str ());
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_error_stalled, decoder.error_code ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
}

void test_pending_limit_allows_partial_frame ()
{
    rconlink::rcon_decoder_t decoder (64);

    std::vector<unsigned char> buf;
    append_frame (buf, 950000000, rconlink::rcon_type_response_value,
                  std::string (40, 'p'));

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[0], 30, &out));
    TEST_ASSERT_EQUAL_INT (
      1, decoder.feed (&buf[30], buf.size () - 30, &out));
}

void test_attempts_reset_on_completion ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, 960000000, rconlink::rcon_type_response_value, "abc");

    std::vector<rconlink::response_t> out;
    decoder.feed (&buf[0], 4, &out);
    decoder.feed (&buf[4], 4, &out);
    TEST_ASSERT_EQUAL_INT (2, static_cast<int> (decoder.attempts ()));

    decoder.feed (&buf[8], buf.size () - 8, &out);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (out.size ()));
    //  One more attempt ran on the empty buffer after the frame.
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (decoder.attempts ()));
}

void test_reset_drops_partial_frame ()
{
    rconlink::rcon_decoder_t decoder (-1);

    std::vector<unsigned char> buf;
    append_frame (buf, 970000000, rconlink::rcon_type_response_value, "abc");

    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[0], 10, &out));
    decoder.reset ();
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));

    TEST_ASSERT_EQUAL_INT (1, feed_all (decoder, buf, &out));
    TEST_ASSERT_EQUAL_STRING ("abc", out[0].body.c_str ());
}

void test_empty_feed ()
{
    rconlink::rcon_decoder_t decoder (-1);
    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (NULL, 0, &out));
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (decoder.pending ()));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_decode_single_frame);
    RUN_TEST (test_decode_byte_at_a_time);
    RUN_TEST (test_decode_two_frames_single_buffer);
    RUN_TEST (test_decode_keeps_trailing_partial_frame);
    RUN_TEST (test_below_minimum_size_waits);
    RUN_TEST (test_declared_size_exceeds_available);
    RUN_TEST (test_size_without_packet_terminator);
    RUN_TEST (test_id_boundaries);
    RUN_TEST (test_terminator_response);
    RUN_TEST (test_terminator_id_with_blank_body);
    RUN_TEST (test_terminator_id_with_body_uses_type);
    RUN_TEST (test_response_kind_by_type);
    RUN_TEST (test_malformed_terminator_discards_buffer);
    RUN_TEST (test_malformed_terminator_after_valid_frame);
    RUN_TEST (test_nonzero_terminator_regular_id_waits);
    RUN_TEST (test_unknown_type_never_completes);
    RUN_TEST (test_pending_limit_reports_stall);
    RUN_TEST (test_pending_limit_allows_partial_frame);
    RUN_TEST (test_attempts_reset_on_completion);
    RUN_TEST (test_reset_drops_partial_frame);
    RUN_TEST (test_empty_feed);

    return UNITY_END ();
}

/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/rcon_decoder.hpp"
#include "protocol/rcon_encoder.hpp"
#include "protocol/rcon_protocol.hpp"
#include "protocol/wire.hpp"

#include <unity.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

void test_encode_command_layout ()
{
    std::vector<unsigned char> buf;
    const int rc = rconlink::encode_command (123456789, "status", &buf);
    TEST_ASSERT_EQUAL_INT (20, rc);
    TEST_ASSERT_EQUAL_INT (20, static_cast<int> (buf.size ()));

    TEST_ASSERT_EQUAL_INT (16, rconlink::get_int32_le (&buf[0]));
    TEST_ASSERT_EQUAL_INT (123456789, rconlink::get_int32_le (&buf[4]));
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_type_execcommand,
                           rconlink::get_int32_le (&buf[8]));
    TEST_ASSERT_EQUAL_MEMORY ("status", &buf[12], 6);
    TEST_ASSERT_EQUAL_HEX8 (0x00, buf[18]);
    TEST_ASSERT_EQUAL_HEX8 (0x00, buf[19]);
}

void test_encode_auth ()
{
    std::vector<unsigned char> buf;
    TEST_ASSERT_EQUAL_INT (20, rconlink::encode_auth (100000001, "secret",
                                                      &buf));
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_type_auth,
                           rconlink::get_int32_le (&buf[8]));
}

void test_encode_terminator ()
{
    std::vector<unsigned char> buf;
    TEST_ASSERT_EQUAL_INT (14, rconlink::encode_terminator (&buf));
    TEST_ASSERT_EQUAL_INT (10, rconlink::get_int32_le (&buf[0]));
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_id_terminator,
                           rconlink::get_int32_le (&buf[4]));
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_type_response_value,
                           rconlink::get_int32_le (&buf[8]));
}

void test_encode_appends ()
{
    std::vector<unsigned char> buf;
    rconlink::encode_command (200000000, "users", &buf);
    rconlink::encode_terminator (&buf);
    TEST_ASSERT_EQUAL_INT (19 + 14, static_cast<int> (buf.size ()));
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_id_terminator,
                           rconlink::get_int32_le (&buf[19 + 4]));
}

void test_encode_rejects_embedded_nul ()
{
    std::vector<unsigned char> buf;
    const std::string body ("bad\0body", 8);
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, rconlink::encode_command (200000001, body, &buf));
    TEST_ASSERT_TRUE (buf.empty ());
}

void test_encode_rejects_oversized_body ()
{
    std::vector<unsigned char> buf;
    const std::string body (rconlink::rcon_max_body_size + 1, 'a');
    TEST_ASSERT_FAILURE_ERRNO (
      EMSGSIZE, rconlink::encode_command (200000002, body, &buf));

    const std::string largest (rconlink::rcon_max_body_size, 'a');
    TEST_ASSERT_EQUAL_INT (
      static_cast<int> (rconlink::rcon_max_packet_size + 4),
      rconlink::encode_command (200000002, largest, &buf));
}

void test_encoded_frame_decodes ()
{
    //  A server echoing a request back produces a frame the decoder takes
    //  verbatim; type 2 doubles as AUTH_RESPONSE.
    std::vector<unsigned char> buf;
    rconlink::encode_command (300000000, "echo hi", &buf);

    rconlink::rcon_decoder_t decoder (-1);
    std::vector<rconlink::response_t> out;
    TEST_ASSERT_EQUAL_INT (1, decoder.feed (&buf[0], buf.size (), &out));
    TEST_ASSERT_EQUAL_INT (300000000, out[0].id);
    TEST_ASSERT_EQUAL_INT (17, out[0].size);
    TEST_ASSERT_EQUAL_STRING ("echo hi", out[0].body.c_str ());
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_encode_command_layout);
    RUN_TEST (test_encode_auth);
    RUN_TEST (test_encode_terminator);
    RUN_TEST (test_encode_appends);
    RUN_TEST (test_encode_rejects_embedded_nul);
    RUN_TEST (test_encode_rejects_oversized_body);
    RUN_TEST (test_encoded_frame_decodes);

    return UNITY_END ();
}

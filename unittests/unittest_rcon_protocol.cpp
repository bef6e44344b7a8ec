/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/rcon_protocol.hpp"
#include "protocol/response.hpp"
#include "protocol/wire.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_valid_ids ()
{
    TEST_ASSERT_TRUE (rconlink::is_valid_id (-1));
    TEST_ASSERT_TRUE (rconlink::is_valid_id (999));
    TEST_ASSERT_TRUE (rconlink::is_valid_id (100000000));
    TEST_ASSERT_TRUE (rconlink::is_valid_id (543210987));
    TEST_ASSERT_TRUE (rconlink::is_valid_id (999999999));
}

void test_invalid_ids ()
{
    TEST_ASSERT_FALSE (rconlink::is_valid_id (0));
    TEST_ASSERT_FALSE (rconlink::is_valid_id (-2));
    TEST_ASSERT_FALSE (rconlink::is_valid_id (1000));
    TEST_ASSERT_FALSE (rconlink::is_valid_id (99999999));
    TEST_ASSERT_FALSE (rconlink::is_valid_id (1000000000));
    TEST_ASSERT_FALSE (rconlink::is_valid_id (INT32_MIN));
    TEST_ASSERT_FALSE (rconlink::is_valid_id (INT32_MAX));
}

void test_resolve_type ()
{
    rconlink::response_type_t tag = rconlink::response_type_auth;
    TEST_ASSERT_TRUE (rconlink::resolve_type (0, &tag));
    TEST_ASSERT_EQUAL_INT (rconlink::response_type_value, tag);
    TEST_ASSERT_TRUE (rconlink::resolve_type (2, &tag));
    TEST_ASSERT_EQUAL_INT (rconlink::response_type_auth, tag);

    TEST_ASSERT_FALSE (rconlink::resolve_type (1, &tag));
    TEST_ASSERT_FALSE (rconlink::resolve_type (3, &tag));
    TEST_ASSERT_FALSE (rconlink::resolve_type (-1, &tag));
}

void test_make_response ()
{
    rconlink::response_t response;
    response.body = "stale";
    response.id = 5;

    TEST_ASSERT_SUCCESS_ERRNO (
      rconlink::make_response (rconlink::response_type_auth, &response));
    TEST_ASSERT_EQUAL_INT (rconlink::response_auth, response.kind);
    TEST_ASSERT_TRUE (response.body.empty ());
    TEST_ASSERT_EQUAL_INT (0, response.id);

    TEST_ASSERT_SUCCESS_ERRNO (
      rconlink::make_response (rconlink::response_type_value, &response));
    TEST_ASSERT_EQUAL_INT (rconlink::response_command, response.kind);

    rconlink::make_terminator_response (&response);
    TEST_ASSERT_TRUE (response.is_terminator ());
}

void test_make_response_unknown_tag ()
{
    rconlink::response_t response;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, rconlink::make_response (
                static_cast<rconlink::response_type_t> (42), &response));
}

void test_names ()
{
    TEST_ASSERT_EQUAL_STRING (
      "terminator", rconlink::response_kind_name (rconlink::response_terminator));
    TEST_ASSERT_EQUAL_STRING (
      "auth", rconlink::response_kind_name (rconlink::response_auth));
    TEST_ASSERT_EQUAL_STRING (
      "command", rconlink::response_kind_name (rconlink::response_command));
    TEST_ASSERT_EQUAL_STRING (
      "malformed terminator packet",
      rconlink::rcon_error_reason (rconlink::rcon_error_malformed_terminator));
    TEST_ASSERT_EQUAL_STRING ("unknown error",
                              rconlink::rcon_error_reason (0x7f));
}

void test_wire_little_endian ()
{
    unsigned char buf[4];
    rconlink::put_int32_le (buf, -1);
    TEST_ASSERT_EQUAL_HEX8 (0xff, buf[0]);
    TEST_ASSERT_EQUAL_HEX8 (0xff, buf[3]);
    TEST_ASSERT_EQUAL_INT (-1, rconlink::get_int32_le (buf));

    rconlink::put_int32_le (buf, 999);
    TEST_ASSERT_EQUAL_HEX8 (0xe7, buf[0]);
    TEST_ASSERT_EQUAL_HEX8 (0x03, buf[1]);
    TEST_ASSERT_EQUAL_HEX8 (0x00, buf[2]);
    TEST_ASSERT_EQUAL_INT (999, rconlink::get_int32_le (buf));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_valid_ids);
    RUN_TEST (test_invalid_ids);
    RUN_TEST (test_resolve_type);
    RUN_TEST (test_make_response);
    RUN_TEST (test_make_response_unknown_tag);
    RUN_TEST (test_names);
    RUN_TEST (test_wire_little_endian);

    return UNITY_END ();
}

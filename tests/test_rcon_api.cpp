/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include <unity.h>
#include <string.h>

static void *decoder;

void setUp ()
{
    decoder = rconlink_decoder_new ();
    TEST_ASSERT_NOT_NULL (decoder);
}

void tearDown ()
{
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_decoder_close (decoder));
    decoder = NULL;
}

static int feed (const std::vector<unsigned char> &buf_)
{
    return rconlink_decoder_feed (decoder, &buf_[0], buf_.size ());
}

void test_version ()
{
    int major, minor, patch;
    rconlink_version (&major, &minor, &patch);
    TEST_ASSERT_EQUAL_INT (RCONLINK_VERSION_MAJOR, major);
    TEST_ASSERT_EQUAL_INT (RCONLINK_VERSION_MINOR, minor);
    TEST_ASSERT_EQUAL_INT (RCONLINK_VERSION_PATCH, patch);
}

void test_feed_and_recv ()
{
    std::vector<unsigned char> buf;
    append_frame (buf, 123456789, RCONLINK_RESPONSE_VALUE, "players: 3");
    append_frame (buf, RCONLINK_ID_TERMINATOR, RCONLINK_RESPONSE_VALUE, "");

    TEST_ASSERT_EQUAL_INT (2, feed (buf));

    rconlink_frame_t frame;
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_decoder_recv (decoder, &frame));
    TEST_ASSERT_EQUAL_INT (20, frame.size);
    TEST_ASSERT_EQUAL_INT (123456789, frame.id);
    TEST_ASSERT_EQUAL_INT (RCONLINK_RESPONSE_VALUE, frame.type);
    TEST_ASSERT_EQUAL_INT (RCONLINK_FRAME_COMMAND, frame.kind);
    TEST_ASSERT_EQUAL_STRING ("players: 3", frame.body);
    TEST_ASSERT_EQUAL_INT (10, static_cast<int> (frame.body_size));
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_frame_close (&frame));
    TEST_ASSERT_NULL (frame.body);

    TEST_ASSERT_SUCCESS_ERRNO (rconlink_decoder_recv (decoder, &frame));
    TEST_ASSERT_EQUAL_INT (RCONLINK_FRAME_TERMINATOR, frame.kind);
    TEST_ASSERT_EQUAL_STRING ("", frame.body);
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_frame_close (&frame));

    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, rconlink_decoder_recv (decoder, &frame));
}

void test_feed_counts_queued_frames ()
{
    std::vector<unsigned char> first;
    append_frame (first, 100000001, RCONLINK_AUTH_RESPONSE, "");
    std::vector<unsigned char> second;
    append_frame (second, 100000002, RCONLINK_RESPONSE_VALUE, "x");

    TEST_ASSERT_EQUAL_INT (1, feed (first));
    TEST_ASSERT_EQUAL_INT (2, feed (second));

    rconlink_frame_t frame;
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_decoder_recv (decoder, &frame));
    TEST_ASSERT_EQUAL_INT (RCONLINK_FRAME_AUTH, frame.kind);
    rconlink_frame_close (&frame);

    TEST_ASSERT_EQUAL_INT (1, rconlink_decoder_feed (decoder, NULL, 0));
}

void test_pending_option ()
{
    std::vector<unsigned char> buf;
    append_frame (buf, 100000003, RCONLINK_RESPONSE_VALUE, "partial");

    TEST_ASSERT_EQUAL_INT (0, rconlink_decoder_feed (decoder, &buf[0], 9));

    uint64_t pending = 0;
    size_t size = sizeof (pending);
    TEST_ASSERT_SUCCESS_ERRNO (
      rconlink_decoder_getopt (decoder, RCONLINK_PENDING, &pending, &size));
    TEST_ASSERT_EQUAL_INT (9, static_cast<int> (pending));
}

void test_maxpending_option ()
{
    int64_t value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (
      rconlink_decoder_getopt (decoder, RCONLINK_MAXPENDING, &value, &size));
    TEST_ASSERT_TRUE (value == RCONLINK_MAXPENDING_DFLT);

    value = 32;
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_decoder_setopt (
      decoder, RCONLINK_MAXPENDING, &value, sizeof (value)));

    std::vector<unsigned char> buf;
    append_frame (buf, 100000004, 5, "this type never resolves");
    TEST_ASSERT_FAILURE_ERRNO (EMSGSIZE, feed (buf));

    int last_error = -1;
    size = sizeof (last_error);
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_decoder_getopt (
      decoder, RCONLINK_LAST_ERROR, &last_error, &size));
    TEST_ASSERT_EQUAL_INT (RCONLINK_ERROR_STALLED, last_error);
}

void test_invalid_options ()
{
    const int small = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, rconlink_decoder_setopt (decoder, RCONLINK_MAXPENDING, &small,
                                       sizeof (small)));

    const int64_t negative = -5;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, rconlink_decoder_setopt (decoder, RCONLINK_MAXPENDING,
                                       &negative, sizeof (negative)));

    //  Unknown option ids are rejected.
    const int zero = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, rconlink_decoder_setopt (decoder, 99, &zero, sizeof (zero)));

    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      rconlink_decoder_setopt (decoder, RCONLINK_PENDING, &zero, sizeof (zero)));

    int64_t value = 0;
    size_t size = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      rconlink_decoder_getopt (decoder, RCONLINK_MAXPENDING, &value, &size));

    size = sizeof (value);
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, rconlink_decoder_getopt (decoder, 99, &value, &size));
}

void test_malformed_terminator_reported ()
{
    std::vector<unsigned char> buf;
    append_raw_frame (buf, 10, RCONLINK_ID_TERMINATOR, RCONLINK_RESPONSE_VALUE,
                      "", 0x10, 0x00);
    append_frame (buf, 100000005, RCONLINK_RESPONSE_VALUE, "lost");

    TEST_ASSERT_EQUAL_INT (0, feed (buf));

    int last_error = -1;
    size_t size = sizeof (last_error);
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_decoder_getopt (
      decoder, RCONLINK_LAST_ERROR, &last_error, &size));
    TEST_ASSERT_EQUAL_INT (RCONLINK_ERROR_MALFORMED_TERMINATOR, last_error);

    uint64_t discarded = 0;
    size = sizeof (discarded);
    TEST_ASSERT_SUCCESS_ERRNO (rconlink_decoder_getopt (
      decoder, RCONLINK_DISCARDED, &discarded, &size));
    TEST_ASSERT_EQUAL_INT (static_cast<int> (buf.size ()),
                           static_cast<int> (discarded));
}

void test_invalid_handle ()
{
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, rconlink_decoder_close (NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, rconlink_decoder_feed (NULL, "", 0));

    int not_a_decoder[16];
    memset (not_a_decoder, 0, sizeof (not_a_decoder));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT,
                               rconlink_decoder_close (not_a_decoder));

    TEST_ASSERT_FAILURE_ERRNO (EFAULT, rconlink_decoder_recv (decoder, NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, rconlink_frame_close (NULL));
}

void test_encode ()
{
    unsigned char buf[64];
    const int rc = rconlink_encode (100000006, RCONLINK_REQUEST_AUTH, "pw", 2,
                                    buf, sizeof (buf));
    TEST_ASSERT_EQUAL_INT (16, rc);
    TEST_ASSERT_EQUAL_HEX8 (12, buf[0]);
    TEST_ASSERT_EQUAL_HEX8 (RCONLINK_REQUEST_AUTH, buf[8]);
    TEST_ASSERT_EQUAL_MEMORY ("pw", buf + 12, 2);

    TEST_ASSERT_FAILURE_ERRNO (
      ENOBUFS, rconlink_encode (100000006, RCONLINK_REQUEST_AUTH, "pw", 2,
                                buf, 15));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, rconlink_encode (100000006, RCONLINK_REQUEST_AUTH, "p\0w", 3,
                               buf, sizeof (buf)));
}

void test_strerror ()
{
    TEST_ASSERT_NOT_NULL (rconlink_strerror (EMSGSIZE));
    TEST_ASSERT_NOT_NULL (rconlink_strerror (EPROTO));
    errno = EAGAIN;
    TEST_ASSERT_EQUAL_INT (EAGAIN, rconlink_errno ());
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_version);
    RUN_TEST (test_feed_and_recv);
    RUN_TEST (test_feed_counts_queued_frames);
    RUN_TEST (test_pending_option);
    RUN_TEST (test_maxpending_option);
    RUN_TEST (test_invalid_options);
    RUN_TEST (test_malformed_terminator_reported);
    RUN_TEST (test_invalid_handle);
    RUN_TEST (test_encode);
    RUN_TEST (test_strerror);

    return UNITY_END ();
}

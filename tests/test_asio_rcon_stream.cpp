/* SPDX-License-Identifier: MPL-2.0 */

/*
 * Loopback tests for the Boost.Asio RCON stream reader.
 *
 * A plain TCP server socket plays the game server; responses are written
 * in pieces so frames arrive split across reads.
 */

#include "testutil.hpp"

#include "asio/rcon_stream.hpp"
#include "core/options.hpp"
#include "protocol/rcon_encoder.hpp"
#include "protocol/rcon_protocol.hpp"

#include <boost/asio.hpp>
#include <unity.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using boost::asio::ip::tcp;

struct loopback_t
{
    loopback_t () : acceptor (io, tcp::endpoint (
                                    boost::asio::ip::address_v4::loopback (), 0)),
                    client (io),
                    server (io)
    {
        client.connect (acceptor.local_endpoint ());
        acceptor.accept (server);
    }

    boost::asio::io_context io;
    tcp::acceptor acceptor;
    tcp::socket client;
    tcp::socket server;
};

struct collected_t
{
    std::vector<rconlink::response_t> frames;
    boost::system::error_code error;
    int errors;

    collected_t () : errors (0) {}
};

static rconlink::rcon_stream_t::frame_handler_t
collect_into (collected_t &collected_)
{
    return [&collected_] (const boost::system::error_code &ec_,
                          const rconlink::response_t *response_) {
        if (response_)
            collected_.frames.push_back (*response_);
        else {
            collected_.error = ec_;
            ++collected_.errors;
        }
    };
}

static void write_in_pieces (tcp::socket &socket_,
                             const std::vector<unsigned char> &buf_,
                             size_t piece_)
{
    for (size_t offset = 0; offset < buf_.size (); offset += piece_) {
        const size_t n = std::min (piece_, buf_.size () - offset);
        boost::asio::write (socket_, boost::asio::buffer (&buf_[offset], n));
    }
}

void setUp ()
{
}

void tearDown ()
{
}

void test_stream_decodes_split_response ()
{
    loopback_t loopback;
    rconlink::options_t options;
    options.read_bufsize = 5;
    rconlink::rcon_stream_t stream (std::move (loopback.client), options);

    collected_t collected;
    stream.start (collect_into (collected));

    std::vector<unsigned char> buf;
    append_frame (buf, 123456789, rconlink::rcon_type_response_value,
                  "first half ");
    append_frame (buf, 123456789, rconlink::rcon_type_response_value,
                  "second half");
    append_frame (buf, rconlink::rcon_id_terminator,
                  rconlink::rcon_type_response_value, "");
    write_in_pieces (loopback.server, buf, 3);
    loopback.server.shutdown (tcp::socket::shutdown_send);

    loopback.io.run ();

    TEST_ASSERT_EQUAL_INT (3, static_cast<int> (collected.frames.size ()));
    TEST_ASSERT_EQUAL_STRING ("first half ",
                              collected.frames[0].body.c_str ());
    TEST_ASSERT_EQUAL_STRING ("second half",
                              collected.frames[1].body.c_str ());
    TEST_ASSERT_TRUE (collected.frames[2].is_terminator ());

    TEST_ASSERT_EQUAL_INT (1, collected.errors);
    TEST_ASSERT_TRUE (collected.error == boost::asio::error::eof);
}

void test_stream_sends_requests ()
{
    loopback_t loopback;
    rconlink::options_t options;
    rconlink::rcon_stream_t stream (std::move (loopback.client), options);

    collected_t collected;
    stream.start (collect_into (collected));

    std::vector<unsigned char> request;
    rconlink::encode_auth (100000001, "secret", &request);
    rconlink::encode_terminator (&request);

    int completions = 0;
    stream.send (request, [&completions] (const boost::system::error_code &ec_,
                                          std::size_t) {
        TEST_ASSERT_FALSE (ec_);
        ++completions;
    });

    std::vector<unsigned char> reply;
    append_frame (reply, 100000001, rconlink::rcon_type_auth_response, "");
    boost::asio::write (loopback.server, boost::asio::buffer (reply));
    loopback.server.shutdown (tcp::socket::shutdown_send);

    loopback.io.run ();

    TEST_ASSERT_EQUAL_INT (1, completions);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (collected.frames.size ()));
    TEST_ASSERT_EQUAL_INT (rconlink::response_auth,
                           collected.frames[0].kind);

    std::vector<unsigned char> received (request.size ());
    boost::asio::read (loopback.server, boost::asio::buffer (received));
    TEST_ASSERT_EQUAL_MEMORY (&request[0], &received[0], request.size ());
}

void test_stream_stops_on_stall ()
{
    loopback_t loopback;
    rconlink::options_t options;
    options.max_pending = 32;
    rconlink::rcon_stream_t stream (std::move (loopback.client), options);

    collected_t collected;
    stream.start (collect_into (collected));

    //  Unknown type code: the decoder never completes this frame.
    std::vector<unsigned char> buf;
    append_frame (buf, 100000002, 9, std::string (64, 'g'));
    boost::asio::write (loopback.server, boost::asio::buffer (buf));

    loopback.io.run ();

    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (collected.frames.size ()));
    TEST_ASSERT_EQUAL_INT (1, collected.errors);
    TEST_ASSERT_TRUE (collected.error == boost::system::errc::protocol_error);
    TEST_ASSERT_EQUAL_INT (rconlink::rcon_error_stalled,
                           stream.decoder ().error_code ());
}

void test_stream_close_drops_partial_frame ()
{
    loopback_t loopback;
    rconlink::options_t options;
    rconlink::rcon_stream_t stream (std::move (loopback.client), options);

    collected_t collected;
    stream.start ([&stream, &collected] (const boost::system::error_code &ec_,
                                         const rconlink::response_t *response_) {
        if (response_) {
            collected.frames.push_back (*response_);
            stream.close ();
        } else {
            collected.error = ec_;
            ++collected.errors;
        }
    });

    std::vector<unsigned char> buf;
    append_frame (buf, 100000003, rconlink::rcon_type_response_value, "one");
    append_frame (buf, 100000004, rconlink::rcon_type_response_value, "two");
    buf.resize (buf.size () - 4);
    boost::asio::write (loopback.server, boost::asio::buffer (buf));

    loopback.io.run ();

    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (collected.frames.size ()));
    TEST_ASSERT_EQUAL_INT (0, collected.errors);
    TEST_ASSERT_FALSE (stream.is_open ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (stream.decoder ().pending ()));
}

struct send_result_t
{
    int calls;
    boost::system::error_code error;

    send_result_t () : calls (0) {}
};

static rconlink::rcon_stream_t::completion_handler_t
record_into (send_result_t &result_)
{
    return [&result_] (const boost::system::error_code &ec_, std::size_t) {
        ++result_.calls;
        result_.error = ec_;
    };
}

void test_stream_completes_every_send_handler ()
{
    loopback_t loopback;
    rconlink::options_t options;
    rconlink::rcon_stream_t stream (std::move (loopback.client), options);

    std::vector<unsigned char> request;
    rconlink::encode_command (100000006, "status", &request);

    send_result_t first;
    send_result_t second;
    send_result_t after_close;
    stream.send (request, record_into (first));
    stream.send (request, record_into (second));
    stream.close ();
    stream.send (request, record_into (after_close));

    //  Nothing runs inline.
    TEST_ASSERT_EQUAL_INT (0, second.calls);
    TEST_ASSERT_EQUAL_INT (0, after_close.calls);

    loopback.io.run ();

    //  The first write was in flight and may have finished before the
    //  close took effect.
    TEST_ASSERT_EQUAL_INT (1, first.calls);
    TEST_ASSERT_EQUAL_INT (1, second.calls);
    TEST_ASSERT_TRUE (second.error == boost::asio::error::operation_aborted);
    TEST_ASSERT_EQUAL_INT (1, after_close.calls);
    TEST_ASSERT_TRUE (after_close.error
                      == boost::asio::error::operation_aborted);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_stream_decodes_split_response);
    RUN_TEST (test_stream_sends_requests);
    RUN_TEST (test_stream_stops_on_stall);
    RUN_TEST (test_stream_close_drops_partial_frame);
    RUN_TEST (test_stream_completes_every_send_handler);

    return UNITY_END ();
}

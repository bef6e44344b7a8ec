/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_RCON_STREAM_HPP_INCLUDED__
#define __RCONLINK_RCON_STREAM_HPP_INCLUDED__

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <vector>

#include "core/options.hpp"
#include "protocol/rcon_decoder.hpp"
#include "protocol/response.hpp"
#include "utils/macros.hpp"

namespace rconlink
{
//  Reads RCON responses from a connected TCP socket using Boost.Asio.
//
//  Every read completion is fed into the connection's decoder and each
//  decoded frame is handed to the frame handler. The read loop stops on
//  peer close, socket error or decoder error; the handler is then called
//  once more with the error and a NULL response.
//
//  All handlers run on the socket's io_context. The stream must outlive
//  the outstanding operations, which close () cancels.
class rcon_stream_t
{
  public:
    typedef std::function<void (const boost::system::error_code &,
                                const response_t *)>
      frame_handler_t;

    typedef std::function<void (const boost::system::error_code &,
                                std::size_t)>
      completion_handler_t;

    rcon_stream_t (boost::asio::ip::tcp::socket socket_,
                   const options_t &options_);
    ~rcon_stream_t ();

    //  Begin the read loop.
    void start (frame_handler_t handler_);

    //  Queue an encoded request. Writes are performed in order; handler_
    //  may be empty. Every handler runs exactly once: requests that are
    //  never written, because the stream was closed or an earlier write
    //  failed, complete with operation_aborted.
    void send (const std::vector<unsigned char> &packet_,
               completion_handler_t handler_ = completion_handler_t ());

    //  Cancel I/O, close the socket and drop any partially buffered frame.
    void close ();

    bool is_open () const { return _socket.is_open (); }

    const rcon_decoder_t &decoder () const { return _decoder; }

  private:
    struct write_request_t
    {
        std::vector<unsigned char> data;
        completion_handler_t handler;
    };

    void start_async_read ();
    void on_read_complete (const boost::system::error_code &ec_,
                           std::size_t bytes_transferred_);

    void start_async_write ();
    void on_write_complete (const boost::system::error_code &ec_,
                            std::size_t bytes_transferred_);

    void abort_queued_writes ();
    void post_aborted (const completion_handler_t &handler_);

    void fail (const boost::system::error_code &ec_);

    boost::asio::ip::tcp::socket _socket;
    rcon_decoder_t _decoder;
    frame_handler_t _handler;

    std::vector<unsigned char> _read_buffer;
    std::vector<response_t> _frames;
    bool _reading;
    bool _stopped;

    std::deque<write_request_t> _write_queue;
    bool _write_pending;

    RCONLINK_NON_COPYABLE_NOR_MOVABLE (rcon_stream_t)
};
}

#endif

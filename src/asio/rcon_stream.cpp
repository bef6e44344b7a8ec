/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "asio/rcon_stream.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <utility>

rconlink::rcon_stream_t::rcon_stream_t (boost::asio::ip::tcp::socket socket_,
                                        const options_t &options_) :
    _socket (std::move (socket_)),
    _decoder (options_.max_pending),
    _read_buffer (static_cast<size_t> (options_.read_bufsize)),
    _reading (false),
    _stopped (false),
    _write_pending (false)
{
    rconlink_assert (options_.read_bufsize > 0);
}

rconlink::rcon_stream_t::~rcon_stream_t ()
{
    close ();
}

void rconlink::rcon_stream_t::start (frame_handler_t handler_)
{
    rconlink_assert (!_reading);
    _handler = handler_;
    _stopped = false;
    start_async_read ();
}

void rconlink::rcon_stream_t::start_async_read ()
{
    RCON_DBG_STREAM ("start_async_read");
    _reading = true;
    _socket.async_read_some (
      boost::asio::buffer (_read_buffer),
      [this] (const boost::system::error_code &ec_, std::size_t bytes_) {
          on_read_complete (ec_, bytes_);
      });
}

void rconlink::rcon_stream_t::on_read_complete (
  const boost::system::error_code &ec_, std::size_t bytes_transferred_)
{
    _reading = false;
    RCON_DBG_STREAM ("on_read_complete: ec=%s, bytes=%zu",
                     ec_.message ().c_str (), bytes_transferred_);

    if (_stopped)
        return;

    if (ec_) {
        if (ec_ == boost::asio::error::operation_aborted)
            return;
        fail (ec_);
        return;
    }

    if (bytes_transferred_ == 0) {
        fail (boost::asio::error::eof);
        return;
    }

    _frames.clear ();
    const int rc =
      _decoder.feed (&_read_buffer[0], bytes_transferred_, &_frames);

    for (size_t i = 0; i < _frames.size () && !_stopped; ++i)
        _handler (boost::system::error_code (), &_frames[i]);
    _frames.clear ();

    if (rc == -1 && !_stopped) {
        RCON_LOG_ERROR ("decoder error: %s",
                        rcon_error_reason (_decoder.error_code ()));
        fail (boost::system::errc::make_error_code (
          boost::system::errc::protocol_error));
        return;
    }

    if (!_stopped)
        start_async_read ();
}

void rconlink::rcon_stream_t::send (const std::vector<unsigned char> &packet_,
                                    completion_handler_t handler_)
{
    if (!_socket.is_open ()) {
        post_aborted (handler_);
        return;
    }

    write_request_t request;
    request.data = packet_;
    request.handler = handler_;
    _write_queue.push_back (request);

    if (!_write_pending)
        start_async_write ();
}

void rconlink::rcon_stream_t::start_async_write ()
{
    if (_write_queue.empty () || !_socket.is_open ())
        return;

    _write_pending = true;
    boost::asio::async_write (
      _socket, boost::asio::buffer (_write_queue.front ().data),
      [this] (const boost::system::error_code &ec_, std::size_t bytes_) {
          on_write_complete (ec_, bytes_);
      });
}

void rconlink::rcon_stream_t::on_write_complete (
  const boost::system::error_code &ec_, std::size_t bytes_transferred_)
{
    _write_pending = false;
    RCON_DBG_STREAM ("on_write_complete: ec=%s, bytes=%zu",
                     ec_.message ().c_str (), bytes_transferred_);

    rconlink_assert (!_write_queue.empty ());
    const completion_handler_t handler = _write_queue.front ().handler;
    _write_queue.pop_front ();
    if (handler)
        handler (ec_, bytes_transferred_);

    //  Queued requests cannot be delivered once a write failed or the
    //  socket was closed.
    if (ec_ || !_socket.is_open ()) {
        abort_queued_writes ();
        return;
    }
    //  The handler may have sent and started the next write already.
    if (!_write_pending)
        start_async_write ();
}

void rconlink::rcon_stream_t::abort_queued_writes ()
{
    while (!_write_queue.empty ()) {
        post_aborted (_write_queue.front ().handler);
        _write_queue.pop_front ();
    }
}

void rconlink::rcon_stream_t::post_aborted (
  const completion_handler_t &handler_)
{
    if (!handler_)
        return;
    const completion_handler_t handler = handler_;
    boost::asio::post (_socket.get_executor (), [handler] () {
        handler (boost::asio::error::operation_aborted, 0);
    });
}

void rconlink::rcon_stream_t::fail (const boost::system::error_code &ec_)
{
    RCON_DBG_STREAM ("stopping read loop: %s", ec_.message ().c_str ());
    _stopped = true;
    if (_handler)
        _handler (ec_, NULL);
}

void rconlink::rcon_stream_t::close ()
{
    _stopped = true;
    if (_socket.is_open ()) {
        boost::system::error_code ec;
        _socket.cancel (ec);
        _socket.close (ec);
        //  Ignore close errors
    }
    //  A pending write still references the front request; its completion
    //  aborts the rest of the queue.
    if (!_write_pending)
        abort_queued_writes ();
    _decoder.reset ();
}

#pragma once
/********************************************************************************
 *                               Fanrelay Project                               *
 *                        Live Sports HLS Metadata Relay                        *
 *                                                                              *
 *  Copyright (c) 2025 The Fanrelay Authors                                     *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <memory>
#include <optional>

#include <libfanrelay/common/types.hpp>
#include <libfanrelay/server/handler.hpp>
#include <libfanrelay/server/metrics.hpp>
#include <libfanrelay/server/request-timer.hpp>

/*
 * @HttpSession
 *
 * One client connection. Everything runs as async ops on the connection's strand, the origin
 * fetches started by ApiHandler included, so no io thread ever waits on a socket:
 *
 *   async_read -> ApiHandler::async_handle -> on_reply -> async_write ---------> async_read
 *                                                 |
 *                                                 +-> async_write_header -> async_pipe
 *                                                       origin read -> client write -> ...
 *
 * The segment relay stays pull-based: the next origin chunk is read only from the completion of
 * the client write that took the previous one, and a failed write cancels the origin body.
 *
 */

namespace asio = boost::asio;
using tcp      = asio::ip::tcp;

namespace libfanrelay::server
{

class HttpSession : public std::enable_shared_from_this<HttpSession>
{
public:
  HttpSession(tcp::socket socket, ApiHandler& handler, Metrics& metrics);
  ~HttpSession();

  void start();

private:
  using StreamResponse   = http::response<http::buffer_body>;
  using StreamSerializer = http::response_serializer<http::buffer_body>;

  beast::tcp_stream                                      m_stream;
  beast::flat_buffer                                     m_buffer;
  std::optional<http::request_parser<http::string_body>> m_parser;
  ApiHandler&                                            m_handler;
  Metrics&                                               m_metrics;
  IPAddr                                                 m_peer;
  std::unique_ptr<RequestTimer>                          m_timer;
  Response                                               m_response;
  std::shared_ptr<relay::SegmentStream>                  m_segment;
  std::optional<StreamResponse>                          m_streamResponse;
  std::optional<StreamSerializer>                        m_serializer;

  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes);
  void do_close();

  void serve(Request req);
  void on_reply(Reply reply, const std::string& method, const std::string& target);
  void write_buffered();
  void on_written(beast::error_code ec, bool keep_alive);

  void write_stream_head();
  void write_chunk(std::span<const char> chunk, std::function<void(bool)> done);
  void on_piped(std::exception_ptr err, relay::PipeResult piped);
  void finish_stream(relay::PipeResult piped);
  void end_stream(bool keep_alive);
};

} // namespace libfanrelay::server

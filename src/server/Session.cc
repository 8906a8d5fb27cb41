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

#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/server/session.hpp>

using Session = libfanrelay::log::SESSION;
using Proxy   = libfanrelay::log::PROXY;

namespace libfanrelay::server
{

namespace
{

auto to_sv(beast::string_view s) -> std::string_view { return {s.data(), s.size()}; }

} // namespace

HttpSession::HttpSession(tcp::socket socket, ApiHandler& handler, Metrics& metrics)
    : m_stream(std::move(socket)), m_handler(handler), m_metrics(metrics)
{
  ++m_metrics.active_connections;
  ++m_metrics.total_connections;

  beast::error_code ec;
  const auto        remote = m_stream.socket().remote_endpoint(ec);
  m_peer                   = ec ? "unknown" : remote.address().to_string();
}

HttpSession::~HttpSession()
{
  if (m_segment && m_segment->body)
    m_segment->body->cancel();
  --m_metrics.active_connections;
  log::TRACE<Session>(LogMode::Async, "Connection from {} released", m_peer);
}

void HttpSession::start()
{
  log::DBG<Session>(LogMode::Async, "New connection from {}", m_peer);
  asio::dispatch(m_stream.get_executor(),
                 beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read()
{
  m_parser.emplace();
  m_parser->body_limit(FANRELAY_REQUEST_BODY_LIMIT);

  m_stream.expires_after(Seconds(FANRELAY_CLIENT_IDLE_SECS));
  http::async_read(m_stream, m_buffer, *m_parser,
                   beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes)
{
  if (ec == http::error::end_of_stream || ec == beast::error::timeout)
  {
    do_close();
    return;
  }

  if (ec)
  {
    if (ec != asio::error::operation_aborted)
      log::DBG<Session>(LogMode::Async, "Read from {} failed: {}", m_peer, ec.message());
    return;
  }

  log::TRACE<Session>(LogMode::Async, "Read {} bytes from {}", bytes, m_peer);
  serve(m_parser->release());
}

void HttpSession::do_close()
{
  beast::error_code ec;
  m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec && ec != asio::error::not_connected)
    log::DBG<Session>(LogMode::Async, "Shutdown of {} failed: {}", m_peer, ec.message());
}

void HttpSession::serve(Request req)
{
  m_timer = std::make_unique<RequestTimer>(m_metrics);

  std::string method(to_sv(req.method_string()));
  std::string target(to_sv(req.target()));

  auto self(shared_from_this());
  m_handler.async_handle(m_stream.get_executor(), std::move(req),
                         [this, self, method = std::move(method),
                          target = std::move(target)](Reply reply)
                         { on_reply(std::move(reply), method, target); });
}

void HttpSession::on_reply(Reply reply, const std::string& method, const std::string& target)
{
  if (m_timer)
    m_timer->mark_status(reply.message.result_int());
  m_timer.reset();

  log::INFO<Session>(LogMode::Async, "{} {} {} -> {}", m_peer, method, target,
                     reply.message.result_int());

  if (!reply.is_streamed())
  {
    m_response = std::move(reply.message);
    write_buffered();
    return;
  }

  m_segment = std::make_shared<relay::SegmentStream>(std::move(*reply.stream));
  m_streamResponse.emplace(std::move(reply.message.base()));
  m_streamResponse->body().data = nullptr;
  m_streamResponse->body().more = true;
  m_serializer.emplace(*m_streamResponse);
  write_stream_head();
}

void HttpSession::write_buffered()
{
  auto self(shared_from_this());
  m_stream.expires_after(Seconds(FANRELAY_CLIENT_WRITE_SECS));
  http::async_write(m_stream, m_response,
                    [this, self](beast::error_code ec, std::size_t)
                    { on_written(ec, m_response.keep_alive()); });
}

void HttpSession::on_written(beast::error_code ec, bool keep_alive)
{
  if (ec)
  {
    log::DBG<Session>(LogMode::Async, "Write to {} failed: {}", m_peer, ec.message());
    do_close();
    return;
  }

  if (keep_alive)
    do_read();
  else
    do_close();
}

void HttpSession::write_stream_head()
{
  auto self(shared_from_this());
  m_stream.expires_after(Seconds(FANRELAY_CLIENT_WRITE_SECS));
  http::async_write_header(
    m_stream, *m_serializer,
    [this, self](beast::error_code ec, std::size_t)
    {
      if (ec)
      {
        log::DBG<Proxy>(LogMode::Async, "Client {} left before the segment head: {}", m_peer,
                        ec.message());
        ++m_metrics.streams_cancelled;
        end_stream(false);
        return;
      }

      relay::SegmentProxy::async_pipe(
        m_segment,
        [this, self](std::span<const char> chunk, std::function<void(bool)> done)
        { write_chunk(chunk, std::move(done)); },
        [this, self](std::exception_ptr err, relay::PipeResult piped)
        { on_piped(err, piped); });
    });
}

void HttpSession::write_chunk(std::span<const char> chunk, std::function<void(bool)> done)
{
  auto& body = m_streamResponse->body();
  body.data  = const_cast<char*>(chunk.data());
  body.size  = chunk.size();
  body.more  = true;

  auto self(shared_from_this());
  m_stream.expires_after(Seconds(FANRELAY_CLIENT_WRITE_SECS));
  http::async_write(m_stream, *m_serializer,
                    [this, self, size = chunk.size(), done = std::move(done)](
                      beast::error_code ec, std::size_t)
                    {
                      // buffer_body reports need_buffer once the chunk is on the wire
                      if (ec == http::error::need_buffer)
                        ec = {};
                      if (ec)
                      {
                        log::DBG<Proxy>(LogMode::Async, "Client {} stopped reading {}: {}",
                                        m_peer, m_segment->origin_url, ec.message());
                        done(false);
                        return;
                      }

                      m_metrics.bytes_relayed += size;
                      done(true);
                    });
}

void HttpSession::on_piped(std::exception_ptr err, relay::PipeResult piped)
{
  if (err)
  {
    // The head is already out, all that is left is to cut the connection
    ++m_metrics.upstream_failures;
    log::ERROR<Proxy>(LogMode::Async, "Origin failed mid-segment {}: {}", m_segment->origin_url,
                      describe(err));
    end_stream(false);
    return;
  }

  if (!piped.completed)
  {
    ++m_metrics.streams_cancelled;
    log::INFO<Proxy>(LogMode::Async, "Relay of {} cancelled after {} bytes",
                     m_segment->origin_url, piped.bytes);
    end_stream(false);
    return;
  }

  finish_stream(piped);
}

void HttpSession::finish_stream(relay::PipeResult piped)
{
  auto& body = m_streamResponse->body();
  body.data  = nullptr;
  body.size  = 0;
  body.more  = false;

  auto self(shared_from_this());
  m_stream.expires_after(Seconds(FANRELAY_CLIENT_WRITE_SECS));
  http::async_write(m_stream, *m_serializer,
                    [this, self, piped](beast::error_code ec, std::size_t)
                    {
                      if (ec)
                      {
                        log::DBG<Proxy>(LogMode::Async, "Finishing {} for {} failed: {}",
                                        m_segment->origin_url, m_peer, ec.message());
                        end_stream(false);
                        return;
                      }

                      log::DBG<Proxy>(LogMode::Async, "Relayed {} bytes of {} to {}",
                                      piped.bytes, m_segment->origin_url, m_peer);
                      end_stream(m_streamResponse->keep_alive());
                    });
}

void HttpSession::end_stream(bool keep_alive)
{
  if (m_segment && m_segment->body)
    m_segment->body->cancel();

  m_serializer.reset();
  m_streamResponse.reset();
  m_segment.reset();

  if (keep_alive)
    do_read();
  else
    do_close();
}

} // namespace libfanrelay::server

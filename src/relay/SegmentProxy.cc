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

#include <libfanrelay/common/error.hpp>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/network/url.hpp>
#include <libfanrelay/relay/segment-proxy.hpp>

using Proxy = libfanrelay::log::PROXY;

namespace libfanrelay::relay
{

auto SegmentProxy::resolve(std::string_view match_id, std::string_view rel_path) const -> AbsURL
{
  const auto base = m_sessions.base_url(match_id);
  if (!base)
  {
    log::WARN<Proxy>(LogMode::Async, "Segment '{}' requested for match {} before its playlist",
                     rel_path, match_id);
    throw RelayError(ErrorKind::SessionNotFound, "Stream base URL not found");
  }

  if (rel_path.empty())
    throw RelayError(ErrorKind::InvalidRequest, "Empty segment path");

  if (network::has_parent_traversal(rel_path))
  {
    log::WARN<Proxy>(LogMode::Async, "Rejected traversal in segment path '{}' (match {})",
                     rel_path, match_id);
    throw RelayError(ErrorKind::InvalidRequest, "Segment path must not leave the stream directory");
  }

  if (const auto absolute = network::parse_url(rel_path))
  {
    const auto origin = network::parse_url(*base);
    if (!origin || !network::same_origin(*absolute, *origin))
    {
      log::WARN<Proxy>(LogMode::Async, "Rejected foreign segment URL {} (match {} relays from {})",
                       rel_path, match_id, *base);
      throw RelayError(ErrorKind::InvalidRequest, "Segment URL is not on the stream origin");
    }
    return AbsURL(rel_path);
  }

  return *base + std::string(rel_path);
}

void SegmentProxy::async_open_segment(asio::any_io_executor ex, std::string_view match_id,
                                      std::string_view rel_path, SegmentHandler handler)
{
  AbsURL url;
  try
  {
    url = resolve(match_id, rel_path);
  }
  catch (const RelayError&)
  {
    asio::post(ex, [err = std::current_exception(), handler = std::move(handler)]
               { handler(err, SegmentStream{}); });
    return;
  }

  log::DBG<Proxy>(LogMode::Async, "Proxying segment: {}", url);

  m_fetcher.async_open(
    ex, url, m_opts.fetch_options(),
    [url, match_id = MatchID(match_id),
     handler = std::move(handler)](std::exception_ptr err, network::UpstreamResponse res)
    {
      if (err)
      {
        log::ERROR<Proxy>(LogMode::Async, "Segment fetch error for match {} at {}: {}",
                          match_id, url, describe(err));
        handler(err, SegmentStream{});
        return;
      }

      if (!res.ok())
      {
        if (res.body)
          res.body->cancel();
        log::ERROR<Proxy>(LogMode::Async, "Failed to fetch segment: {}, status {}", url,
                          res.status);
        handler(std::make_exception_ptr(RelayError(ErrorKind::UpstreamUnavailable,
                                                   "Failed to fetch segment", res.status)),
                SegmentStream{});
        return;
      }

      SegmentStream out;
      out.status         = res.status;
      out.content_type   = res.content_type.empty()
                             ? macros::to_string(macros::CONTENT_TYPE_OCTET_STREAM)
                             : std::move(res.content_type);
      out.content_length = res.content_length;
      out.body           = std::move(res.body);
      out.origin_url     = url;
      handler(nullptr, std::move(out));
    });
}

namespace
{

class SegmentPipe : public std::enable_shared_from_this<SegmentPipe>
{
public:
  SegmentPipe(std::shared_ptr<SegmentStream> stream, ChunkSink sink,
              SegmentProxy::PipeHandler handler)
      : m_stream(std::move(stream)), m_sink(std::move(sink)), m_handler(std::move(handler)),
        m_chunk(FANRELAY_STREAM_CHUNK_SIZE)
  {
  }

  void read_next()
  {
    auto self(shared_from_this());
    m_stream->body->async_read(m_chunk, [this, self](std::exception_ptr err, ByteCount n)
                               { on_read(err, n); });
  }

private:
  std::shared_ptr<SegmentStream> m_stream;
  ChunkSink                      m_sink;
  SegmentProxy::PipeHandler      m_handler;
  ChunkBuffer                    m_chunk;
  PipeResult                     m_result;

  void on_read(std::exception_ptr err, ByteCount n)
  {
    if (err)
    {
      m_handler(err, m_result);
      return;
    }

    if (n == 0)
    {
      m_result.completed = true;
      m_handler(nullptr, m_result);
      return;
    }

    auto self(shared_from_this());
    m_sink(std::span<const char>(m_chunk.data(), n),
           [this, self, n](bool delivered)
           {
             if (!delivered)
             {
               m_stream->body->cancel();
               log::DBG<Proxy>(LogMode::Async,
                               "Client went away after {} bytes of {}, origin cancelled",
                               m_result.bytes, m_stream->origin_url);
               m_handler(nullptr, m_result);
               return;
             }

             m_result.bytes += n;
             read_next();
           });
  }
};

} // namespace

void SegmentProxy::async_pipe(std::shared_ptr<SegmentStream> stream, ChunkSink sink,
                              PipeHandler handler)
{
  if (!stream->body)
  {
    PipeResult done;
    done.completed = true;
    handler(nullptr, done);
    return;
  }

  std::make_shared<SegmentPipe>(std::move(stream), std::move(sink), std::move(handler))
    ->read_next();
}

} // namespace libfanrelay::relay

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
#include <libfanrelay/network/fetcher.hpp>

using Network = libfanrelay::log::NET;

namespace libfanrelay::network
{

namespace
{

// One async_fetch_all() in flight: open -> read until 0 -> hand the buffer over
class BufferedFetch : public std::enable_shared_from_this<BufferedFetch>
{
public:
  BufferedFetch(AbsURL url, ByteCount max_bytes, IUpstreamFetcher::FetchHandler handler)
      : m_url(std::move(url)), m_maxBytes(max_bytes), m_handler(std::move(handler)),
        m_chunk(FANRELAY_STREAM_CHUNK_SIZE)
  {
  }

  void on_open(std::exception_ptr err, UpstreamResponse res)
  {
    if (err)
    {
      finish(err);
      return;
    }

    m_res              = std::move(res);
    m_out.status       = m_res.status;
    m_out.content_type = m_res.content_type;

    if (!m_res.body)
    {
      finish(nullptr);
      return;
    }

    if (!m_res.ok())
    {
      m_res.body->cancel();
      finish(nullptr);
      return;
    }

    if (m_res.content_length && *m_res.content_length > m_maxBytes)
    {
      m_res.body->cancel();
      finish(std::make_exception_ptr(RelayError(
        ErrorKind::UpstreamError, std::format("response from {} is {} bytes, limit is {}", m_url,
                                              *m_res.content_length, m_maxBytes))));
      return;
    }

    read_next();
  }

private:
  AbsURL                         m_url;
  ByteCount                      m_maxBytes;
  IUpstreamFetcher::FetchHandler m_handler;
  ChunkBuffer                    m_chunk;
  UpstreamResponse               m_res;
  FetchResult                    m_out;

  void read_next()
  {
    auto self(shared_from_this());
    m_res.body->async_read(m_chunk, [this, self](std::exception_ptr err, ByteCount n)
                           { on_read(err, n); });
  }

  void on_read(std::exception_ptr err, ByteCount n)
  {
    if (err)
    {
      finish(err);
      return;
    }

    if (n == 0)
    {
      log::TRACE<Network>(LogMode::Async, "Buffered {} bytes from {}", m_out.body.size(), m_url);
      finish(nullptr);
      return;
    }

    if (m_out.body.size() + n > m_maxBytes)
    {
      m_res.body->cancel();
      finish(std::make_exception_ptr(RelayError(
        ErrorKind::UpstreamError,
        std::format("response from {} exceeded {} bytes", m_url, m_maxBytes))));
      return;
    }

    m_out.body.append(m_chunk.data(), n);
    read_next();
  }

  void finish(std::exception_ptr err)
  {
    // The origin connection is released before the caller continues
    m_res.body.reset();
    m_handler(err, err ? FetchResult{} : std::move(m_out));
  }
};

} // namespace

void IUpstreamFetcher::async_fetch_all(asio::any_io_executor ex, const AbsURL& url,
                                       FetchOptions opts, ByteCount max_bytes,
                                       FetchHandler handler)
{
  opts.scope = TimeoutScope::Total;

  auto op = std::make_shared<BufferedFetch>(url, max_bytes, std::move(handler));
  async_open(std::move(ex), url, opts, [op](std::exception_ptr err, UpstreamResponse res)
             { op->on_open(err, std::move(res)); });
}

} // namespace libfanrelay::network

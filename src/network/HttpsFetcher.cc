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

#include <openssl/err.h>
#include <type_traits>

#include <libfanrelay/common/error.hpp>
#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/network/entry.hpp>

using Network = libfanrelay::log::NET;

namespace libfanrelay::network
{

namespace
{

using Parser = http::response_parser<http::buffer_body>;

auto failure(std::string_view stage, const AbsURL& url, const beast::error_code& ec,
             Milliseconds timeout) -> std::exception_ptr
{
  const std::string reason = ec == beast::error::timeout
                               ? std::format("timed out after {} ms", timeout.count())
                               : ec.message();
  return std::make_exception_ptr(
    RelayError(ErrorKind::UpstreamError, std::format("{} {}: {}", stage, url, reason)));
}

// Socket, parser and deadline policy of one origin exchange. Shared by the open chain, the
// body handed to the caller and whatever read is pending on it.
template <typename Stream> struct OriginLink
{
  template <typename... Args>
  OriginLink(AbsURL url_, const FetchOptions& opts, Args&&... args)
      : stream(std::forward<Args>(args)...), url(std::move(url_)), timeout(opts.timeout),
        scope(opts.scope), deadline(SteadyClock::now() + opts.timeout)
  {
    parser.header_limit(FANRELAY_UPSTREAM_HEADER_LIMIT);
    parser.body_limit(boost::none);
  }

  Stream             stream;
  beast::flat_buffer buffer;
  Parser             parser;
  AbsURL             url;
  Milliseconds       timeout;
  TimeoutScope       scope;
  TimePoint          deadline;
  bool               closed = false;

  auto socket() -> beast::tcp_stream& { return beast::get_lowest_layer(stream); }

  // Arms the tcp_stream for the next operation
  void arm()
  {
    if (scope == TimeoutScope::Total)
      socket().expires_at(deadline);
    else
      socket().expires_after(timeout);
  }

  void close() noexcept
  {
    if (closed)
      return;
    closed = true;

    beast::error_code ec;
    socket().socket().close(ec);
    if (ec)
      log::TRACE<Network>(LogMode::Async, "Closing origin socket for {}: {}", url, ec.message());
  }
};

// Reads until at least one body byte landed in `out`, the body ended, or the link failed
template <typename Stream>
void read_some(std::shared_ptr<OriginLink<Stream>> link, std::span<char> out,
               UpstreamBody::ReadHandler handler)
{
  if (link->closed || link->parser.is_done() || out.empty())
  {
    link->close();
    asio::post(link->stream.get_executor(),
               [handler = std::move(handler)] { handler(nullptr, 0); });
    return;
  }

  auto& body = link->parser.get().body();
  body.data  = out.data();
  body.size  = out.size();

  link->arm();
  http::async_read(link->stream, link->buffer, link->parser,
                   [link, out, handler = std::move(handler)](beast::error_code ec,
                                                             std::size_t) mutable
                   {
                     if (ec == http::error::need_buffer)
                       ec = {};

                     if (ec)
                     {
                       // A cancelled body simply ends
                       if (link->closed)
                       {
                         handler(nullptr, 0);
                         return;
                       }
                       link->close();
                       handler(failure("reading body of", link->url, ec, link->timeout), 0);
                       return;
                     }

                     const ByteCount n = out.size() - link->parser.get().body().size;
                     if (n > 0)
                     {
                       handler(nullptr, n);
                       return;
                     }

                     // Only framing (chunk headers) was consumed
                     read_some(std::move(link), out, std::move(handler));
                   });
}

template <typename Stream> class BeastUpstreamBody final : public UpstreamBody
{
public:
  explicit BeastUpstreamBody(std::shared_ptr<OriginLink<Stream>> link) : m_link(std::move(link))
  {
  }

  ~BeastUpstreamBody() override { cancel(); }

  void async_read(std::span<char> out, ReadHandler handler) override
  {
    read_some(m_link, out, std::move(handler));
  }

  void cancel() noexcept override { m_link->close(); }

private:
  std::shared_ptr<OriginLink<Stream>> m_link;
};

template <typename Stream> class OpenOperation
    : public std::enable_shared_from_this<OpenOperation<Stream>>
{
public:
  static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

  OpenOperation(std::shared_ptr<OriginLink<Stream>> link, const asio::any_io_executor& ex,
                Url url, const FetchOptions& opts, bool verify_tls,
                IUpstreamFetcher::OpenHandler handler)
      : m_link(std::move(link)), m_resolver(ex), m_resolveTimer(ex), m_url(std::move(url)),
        m_userAgent(opts.user_agent), m_verifyTls(verify_tls), m_handler(std::move(handler))
  {
  }

  void start()
  {
    auto self(this->shared_from_this());

    m_resolveTimer.expires_at(m_link->scope == TimeoutScope::Total
                                ? m_link->deadline
                                : SteadyClock::now() + m_link->timeout);
    m_resolveTimer.async_wait(
      [this, self](beast::error_code ec)
      {
        if (ec)
          return;
        m_resolveTimedOut = true;
        m_resolver.cancel();
      });

    m_resolver.async_resolve(m_url.host, std::to_string(m_url.port),
                             [this, self](beast::error_code ec, tcp::resolver::results_type found)
                             { on_resolve(ec, std::move(found)); });
  }

private:
  std::shared_ptr<OriginLink<Stream>> m_link;
  tcp::resolver                       m_resolver;
  asio::steady_timer                  m_resolveTimer;
  Url                                 m_url;
  UserAgent                           m_userAgent;
  bool                                m_verifyTls;
  IUpstreamFetcher::OpenHandler       m_handler;
  http::request<http::empty_body>     m_req;
  bool                                m_resolveTimedOut = false;

  void fail(std::string_view stage, beast::error_code ec)
  {
    m_link->close();
    m_handler(failure(stage, m_link->url, ec, m_link->timeout), UpstreamResponse{});
  }

  void on_resolve(beast::error_code ec, tcp::resolver::results_type found)
  {
    m_resolveTimer.cancel();
    if (m_resolveTimedOut)
      ec = beast::error::timeout;
    if (ec)
    {
      fail("resolving", ec);
      return;
    }

    // Idle scope: one `timeout` for connect, handshake, request and response head
    if (m_link->scope == TimeoutScope::Idle)
      m_link->deadline = SteadyClock::now() + m_link->timeout;
    m_link->socket().expires_at(m_link->deadline);

    auto self(this->shared_from_this());
    m_link->socket().async_connect(found, [this, self](beast::error_code e, const tcp::endpoint&)
                                   { on_connect(e); });
  }

  void on_connect(beast::error_code ec)
  {
    if (ec)
    {
      fail("connecting to", ec);
      return;
    }

    if constexpr (kTls)
    {
      if (!SSL_set_tlsext_host_name(m_link->stream.native_handle(), m_url.host.c_str()))
      {
        fail("setting SNI for",
             beast::error_code{static_cast<int>(::ERR_get_error()),
                               asio::error::get_ssl_category()});
        return;
      }

      if (m_verifyTls)
        m_link->stream.set_verify_callback(ssl::host_name_verification(m_url.host));

      auto self(this->shared_from_this());
      m_link->stream.async_handshake(ssl::stream_base::client,
                                     [this, self](beast::error_code e)
                                     {
                                       if (e)
                                       {
                                         fail("TLS handshake with", e);
                                         return;
                                       }
                                       send_request();
                                     });
    }
    else
    {
      send_request();
    }
  }

  void send_request()
  {
    m_req = http::request<http::empty_body>{http::verb::get, m_url.target, 11};
    m_req.set(http::field::host, m_url.host_header());
    m_req.set(http::field::user_agent, m_userAgent);
    m_req.set(http::field::accept, "*/*");
    // Bodies are relayed verbatim, so no content coding may sneak in
    m_req.set(http::field::accept_encoding, "identity");
    m_req.set(http::field::connection, "close");

    auto self(this->shared_from_this());
    http::async_write(m_link->stream, m_req,
                      [this, self](beast::error_code ec, std::size_t)
                      {
                        if (ec)
                        {
                          fail("sending request to", ec);
                          return;
                        }
                        read_head();
                      });
  }

  void read_head()
  {
    auto self(this->shared_from_this());
    http::async_read_header(m_link->stream, m_link->buffer, m_link->parser,
                            [this, self](beast::error_code ec, std::size_t) { on_head(ec); });
  }

  void on_head(beast::error_code ec)
  {
    if (ec)
    {
      fail("reading response head of", ec);
      return;
    }

    UpstreamResponse out;
    {
      const auto& head = m_link->parser.get();
      out.status       = head.result_int();
      out.content_type = std::string(head[http::field::content_type]);
      if (const auto len = m_link->parser.content_length())
        out.content_length = *len;
    }

    log::DBG<Network>(LogMode::Async, "{} -> {} ({})", m_link->url, out.status,
                      out.content_type.empty() ? "no content-type" : out.content_type);

    out.body = std::make_unique<BeastUpstreamBody<Stream>>(m_link);
    m_handler(nullptr, std::move(out));
  }
};

} // namespace

HttpsFetcher::HttpsFetcher(bool verify_tls)
    : m_sslCtx(ssl::context::tls_client), m_verifyTls(verify_tls)
{
  if (m_verifyTls)
  {
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(ssl::verify_peer);
  }
  else
  {
    log::WARN<Network>("TLS peer verification is DISABLED for upstream fetches");
    m_sslCtx.set_verify_mode(ssl::verify_none);
  }
}

void HttpsFetcher::async_open(asio::any_io_executor ex, const AbsURL& url,
                              const FetchOptions& opts, OpenHandler handler)
{
  auto parsed = parse_url(url);
  if (!parsed)
  {
    asio::post(ex,
               [url, handler = std::move(handler)]
               {
                 handler(std::make_exception_ptr(RelayError(
                           ErrorKind::UpstreamError, "not an absolute http(s) URL: " + url)),
                         UpstreamResponse{});
               });
    return;
  }

  log::DBG<Network>(LogMode::Async, "GET {}", url);

  const AbsURL full = parsed->str();
  if (parsed->is_tls())
  {
    using Stream = beast::ssl_stream<beast::tcp_stream>;
    auto link    = std::make_shared<OriginLink<Stream>>(full, opts, ex, m_sslCtx);
    std::make_shared<OpenOperation<Stream>>(std::move(link), ex, std::move(*parsed), opts,
                                            m_verifyTls, std::move(handler))
      ->start();
    return;
  }

  auto link = std::make_shared<OriginLink<beast::tcp_stream>>(full, opts, ex);
  std::make_shared<OpenOperation<beast::tcp_stream>>(std::move(link), ex, std::move(*parsed),
                                                     opts, m_verifyTls, std::move(handler))
    ->start();
}

} // namespace libfanrelay::network

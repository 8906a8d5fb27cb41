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

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

#include <libfanrelay/common/error.hpp>
#include <libfanrelay/network/entry.hpp>

#include <Support/Await.hpp>
#include <Support/LocalOrigin.hpp>

using namespace fanrelay_test;
using namespace libfanrelay;
using namespace std::chrono_literals;

namespace
{

auto open(asio::io_context& ioc, network::IUpstreamFetcher& fetcher, const AbsURL& url,
          const network::FetchOptions& opts = {}) -> network::UpstreamResponse
{
  return await<network::UpstreamResponse>(
    ioc, [&](auto done) { fetcher.async_open(ioc.get_executor(), url, opts, std::move(done)); });
}

auto drain(asio::io_context& ioc, network::UpstreamBody& body) -> std::string
{
  std::string out;
  char        chunk[4096];
  while (const auto n = await<ByteCount>(
           ioc, [&](auto done) { body.async_read(std::span<char>(chunk), std::move(done)); }))
    out.append(chunk, n);
  return out;
}

// Sends a head announcing `length` bytes, then one byte every `every` until the client leaves
auto trickle(std::size_t length, std::chrono::milliseconds every) -> LocalOrigin::Respond
{
  return [=](tcp::socket& socket, const LocalOrigin::Request&)
  {
    const std::string head = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
                             "Content-Length: " +
                             std::to_string(length) + "\r\nConnection: close\r\n\r\n";
    beast::error_code ec;
    asio::write(socket, asio::buffer(head), ec);
    for (std::size_t i = 0; i < length && !ec; ++i)
    {
      std::this_thread::sleep_for(every);
      asio::write(socket, asio::buffer("x", 1), ec);
    }
  };
}

} // namespace

TEST(HttpsFetcher, StreamsBodyWithLength)
{
  const std::string payload(100'000, 's');
  LocalOrigin       origin(respond_with(200, payload, "video/mp2t"));

  asio::io_context      ioc;
  network::HttpsFetcher fetcher;
  network::FetchOptions opts;
  opts.user_agent = "fanrelay-test/1";

  auto res = open(ioc, fetcher, origin.url("/live/seg-1.ts?token=abc"), opts);
  EXPECT_EQ(res.status, 200u);
  EXPECT_EQ(res.content_type, "video/mp2t");
  ASSERT_TRUE(res.content_length.has_value());
  EXPECT_EQ(*res.content_length, payload.size());
  EXPECT_EQ(drain(ioc, *res.body), payload);

  const auto req = origin.last_request();
  EXPECT_EQ(req.method(), http::verb::get);
  EXPECT_EQ(req.target(), "/live/seg-1.ts?token=abc");
  EXPECT_EQ(req[http::field::user_agent], "fanrelay-test/1");
  EXPECT_EQ(req[http::field::accept_encoding], "identity");
  EXPECT_FALSE(req[http::field::host].empty());
}

TEST(HttpsFetcher, StreamsChunkedBody)
{
  LocalOrigin origin(respond_with(200, "#EXTM3U\nv.m3u8\n", "application/vnd.apple.mpegurl",
                                  true));

  asio::io_context      ioc;
  network::HttpsFetcher fetcher;
  auto                  res = open(ioc, fetcher, origin.url("/master.m3u8"));
  EXPECT_EQ(res.status, 200u);
  EXPECT_FALSE(res.content_length.has_value());
  EXPECT_EQ(drain(ioc, *res.body), "#EXTM3U\nv.m3u8\n");
}

TEST(HttpsFetcher, ReportsErrorStatusWithoutFailing)
{
  LocalOrigin origin(respond_with(404, "missing", "text/plain"));

  asio::io_context      ioc;
  network::HttpsFetcher fetcher;
  const auto            out = await<network::FetchResult>(
    ioc,
    [&](auto done)
    {
      fetcher.async_fetch_all(ioc.get_executor(), origin.url("/gone.m3u8"), {}, 1 << 20,
                              std::move(done));
    });
  EXPECT_EQ(out.status, 404u);
  EXPECT_TRUE(out.body.empty());
}

TEST(HttpsFetcher, TimesOutOnSilentOrigin)
{
  LocalOrigin origin([](tcp::socket&, const LocalOrigin::Request&)
                     { std::this_thread::sleep_for(1500ms); });

  asio::io_context      ioc;
  network::HttpsFetcher fetcher;
  network::FetchOptions opts;
  opts.timeout = Milliseconds(200);

  try
  {
    (void)open(ioc, fetcher, origin.url("/slow.m3u8"), opts);
    FAIL() << "expected a timeout";
  }
  catch (const RelayError& e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::UpstreamError);
    EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
  }
}

TEST(HttpsFetcher, BufferedFetchHasOneDeadlineForTheWholeBody)
{
  // Every byte arrives well within the timeout, the body as a whole does not
  LocalOrigin origin(trickle(40, 50ms));

  asio::io_context      ioc;
  network::HttpsFetcher fetcher;
  network::FetchOptions opts;
  opts.timeout = Milliseconds(300);

  const auto started = SteadyClock::now();
  try
  {
    (void)await<network::FetchResult>(ioc,
                                      [&](auto done)
                                      {
                                        fetcher.async_fetch_all(ioc.get_executor(),
                                                                origin.url("/feed.json"), opts,
                                                                1 << 20, std::move(done));
                                      });
    FAIL() << "expected a timeout";
  }
  catch (const RelayError& e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::UpstreamError);
    EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos) << e.what();
  }
  EXPECT_LT(SteadyClock::now() - started, 1500ms);
}

TEST(HttpsFetcher, StreamedBodyOnlyHasAnIdleDeadline)
{
  LocalOrigin origin(trickle(10, 50ms));

  asio::io_context      ioc;
  network::HttpsFetcher fetcher;
  network::FetchOptions opts;
  opts.timeout = Milliseconds(300);
  opts.scope   = network::TimeoutScope::Idle;

  auto res = open(ioc, fetcher, origin.url("/seg.ts"), opts);
  EXPECT_EQ(drain(ioc, *res.body), std::string(10, 'x'));
}

TEST(HttpsFetcher, RefusedConnectionIsUpstreamError)
{
  // Grab a port and release it so nothing listens there
  asio::io_context ioc;
  PortNo           port = 0;
  {
    tcp::acceptor spare(ioc, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0});
    port = spare.local_endpoint().port();
  }

  network::HttpsFetcher fetcher;
  try
  {
    (void)open(ioc, fetcher, "http://127.0.0.1:" + std::to_string(port) + "/x.ts");
    FAIL() << "expected a connect failure";
  }
  catch (const RelayError& e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::UpstreamError);
  }
}

TEST(HttpsFetcher, RejectsUnsupportedUrl)
{
  asio::io_context      ioc;
  network::HttpsFetcher fetcher;
  EXPECT_THROW((void)open(ioc, fetcher, "ftp://cdn.example/a.ts"), RelayError);
}

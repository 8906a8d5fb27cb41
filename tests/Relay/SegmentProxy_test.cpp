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

#include <gtest/gtest.h>
#include <optional>

#include <libfanrelay/relay/segment-proxy.hpp>

#include <Support/Await.hpp>
#include <Support/FakeFetcher.hpp>

using namespace fanrelay_test;
using namespace libfanrelay::relay;

namespace
{

class SegmentProxyTest : public ::testing::Test
{
protected:
  asio::io_context  ioc;
  FakeFetcher       fetcher;
  RelaySessionStore sessions;
  SegmentProxy      proxy{sessions, fetcher, RelayOptions{}};

  void SetUp() override { sessions.record("1", "https://cdn.example/a/"); }

  auto open(std::string_view match_id, std::string_view path) -> std::shared_ptr<SegmentStream>
  {
    auto stream = await<SegmentStream>(ioc,
                                       [&](auto done)
                                       {
                                         proxy.async_open_segment(ioc.get_executor(), match_id,
                                                                  path, std::move(done));
                                       });
    return std::make_shared<SegmentStream>(std::move(stream));
  }

  auto pipe(std::shared_ptr<SegmentStream> stream, ChunkSink sink) -> PipeResult
  {
    return await<PipeResult>(ioc,
                             [&](auto done)
                             {
                               SegmentProxy::async_pipe(std::move(stream), std::move(sink),
                                                        std::move(done));
                             });
  }

  auto error_of(std::string_view match_id, std::string_view path) -> RelayError
  {
    try
    {
      (void)open(match_id, path);
    }
    catch (const RelayError& e)
    {
      return e;
    }
    ADD_FAILURE() << "async_open_segment(" << match_id << ", " << path << ") did not throw";
    return RelayError(ErrorKind::NotFound, "");
  }
};

} // namespace

TEST_F(SegmentProxyTest, ResolvesAgainstRecordedBase)
{
  EXPECT_EQ(proxy.resolve("1", "chunk1.ts"), "https://cdn.example/a/chunk1.ts");
  EXPECT_EQ(proxy.resolve("1", "720p/seg-3.ts?t=9"), "https://cdn.example/a/720p/seg-3.ts?t=9");
  EXPECT_EQ(proxy.resolve("1", "https://cdn.example/other/x.ts"),
            "https://cdn.example/other/x.ts");
}

TEST_F(SegmentProxyTest, StreamsOriginBytesAndContentType)
{
  ScriptedResponse seg;
  seg.body         = std::string(150'000, 'T');
  seg.content_type = "video/mp2t";
  fetcher.serve("https://cdn.example/a/chunk1.ts", seg);

  auto stream = open("1", "chunk1.ts");
  EXPECT_EQ(stream->status, 200u);
  EXPECT_EQ(stream->content_type, "video/mp2t");
  EXPECT_EQ(stream->content_length, 150'000u);
  EXPECT_EQ(stream->origin_url, "https://cdn.example/a/chunk1.ts");

  std::string              received;
  std::vector<std::size_t> sizes;
  const ChunkSink          sink = [&](std::span<const char> chunk, std::function<void(bool)> done)
  {
    received.append(chunk.data(), chunk.size());
    sizes.push_back(chunk.size());
    done(true);
  };

  const auto result = pipe(stream, sink);
  EXPECT_TRUE(result.completed);
  EXPECT_EQ(result.bytes, 150'000u);
  EXPECT_EQ(received, seg.body);
  for (const auto size : sizes)
    EXPECT_LE(size, static_cast<std::size_t>(FANRELAY_STREAM_CHUNK_SIZE));
  EXPECT_FALSE(fetcher.last_trace()->cancelled.load());
}

TEST_F(SegmentProxyTest, MissingContentTypeDefaultsToOctetStream)
{
  fetcher.serve("https://cdn.example/a/x.ts", 200, "abc");
  const auto stream = open("1", "x.ts");
  EXPECT_EQ(stream->content_type, "application/octet-stream");
}

TEST_F(SegmentProxyTest, SinkFailureCancelsOrigin)
{
  ScriptedResponse seg;
  seg.body     = std::string(10'000, 'x');
  seg.max_read = 1000;
  fetcher.serve("https://cdn.example/a/long.ts", seg);

  auto stream = open("1", "long.ts");

  int             calls = 0;
  const ChunkSink sink  = [&](std::span<const char>, std::function<void(bool)> done)
  { done(++calls < 3); };

  const auto result = pipe(stream, sink);
  EXPECT_FALSE(result.completed);
  EXPECT_EQ(result.bytes, 2000u);
  EXPECT_TRUE(fetcher.last_trace()->cancelled.load());
  EXPECT_EQ(fetcher.last_trace()->delivered.load(), 3000u);
}

TEST_F(SegmentProxyTest, UnknownSessionIsSessionNotFound)
{
  const auto err = error_of("2", "chunk1.ts");
  EXPECT_EQ(err.kind(), ErrorKind::SessionNotFound);
  EXPECT_STREQ(err.what(), "Stream base URL not found");
  EXPECT_EQ(fetcher.calls(), 0u);
}

TEST_F(SegmentProxyTest, TraversalAndForeignOriginsAreRejectedWithoutFetching)
{
  EXPECT_EQ(error_of("1", "../x.ts").kind(), ErrorKind::InvalidRequest);
  EXPECT_EQ(error_of("1", "a/%2E%2E/%2e%2e/x.ts").kind(), ErrorKind::InvalidRequest);
  EXPECT_EQ(error_of("1", "https://evil.example/x.ts").kind(), ErrorKind::InvalidRequest);
  EXPECT_EQ(error_of("1", "").kind(), ErrorKind::InvalidRequest);
  EXPECT_EQ(fetcher.calls(), 0u);
}

TEST_F(SegmentProxyTest, OriginStatusIsCarried)
{
  fetcher.serve("https://cdn.example/a/gone.ts", 410, "gone");
  const auto err = error_of("1", "gone.ts");
  EXPECT_EQ(err.kind(), ErrorKind::UpstreamUnavailable);
  EXPECT_EQ(err.upstream_status(), 410u);
  EXPECT_TRUE(fetcher.last_trace()->cancelled.load());
}

TEST_F(SegmentProxyTest, TransportFailureIsUpstreamError)
{
  ScriptedResponse broken;
  broken.fail = true;
  fetcher.serve("https://cdn.example/a/x.ts", broken);
  EXPECT_EQ(error_of("1", "x.ts").kind(), ErrorKind::UpstreamError);
}

TEST_F(SegmentProxyTest, NextOriginReadWaitsForTheSink)
{
  ScriptedResponse seg;
  seg.body     = std::string(3000, 's');
  seg.max_read = 1000;
  fetcher.serve("https://cdn.example/a/slow.ts", seg);

  auto stream = open("1", "slow.ts");

  std::function<void(bool)> pending;
  std::optional<PipeResult> result;
  SegmentProxy::async_pipe(
    stream,
    [&](std::span<const char>, std::function<void(bool)> done) { pending = std::move(done); },
    [&](std::exception_ptr err, PipeResult piped)
    {
      EXPECT_EQ(err, nullptr);
      result = piped;
    });

  ioc.restart();
  ioc.run();
  ASSERT_TRUE(pending);
  EXPECT_EQ(fetcher.last_trace()->delivered.load(), 1000u);

  for (int i = 0; i < 3 && !result; ++i)
  {
    auto next = std::move(pending);
    pending   = nullptr;
    next(true);

    ioc.restart();
    ioc.run();
    EXPECT_LE(fetcher.last_trace()->delivered.load(), 1000u * (i + 2));
  }

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->completed);
  EXPECT_EQ(result->bytes, 3000u);
}

TEST_F(SegmentProxyTest, StalledOriginHoldsOnlyItsOwnPipe)
{
  ScriptedResponse seg;
  seg.body  = "first";
  seg.stall = true;
  fetcher.serve("https://cdn.example/a/live.ts", seg);
  fetcher.serve("https://cdn.example/a/other.ts", 200, "other");

  auto stalled = open("1", "live.ts");

  std::string received;
  bool        finished = false;
  SegmentProxy::async_pipe(
    stalled,
    [&](std::span<const char> chunk, std::function<void(bool)> done)
    {
      received.append(chunk.data(), chunk.size());
      done(true);
    },
    [&](std::exception_ptr, PipeResult) { finished = true; });

  // A second segment completes on the same single-threaded io_context meanwhile
  std::string other;
  const auto  result =
    pipe(open("1", "other.ts"), [&](std::span<const char> chunk, std::function<void(bool)> done)
         {
           other.append(chunk.data(), chunk.size());
           done(true);
         });

  EXPECT_TRUE(result.completed);
  EXPECT_EQ(other, "other");
  EXPECT_EQ(received, "first");
  EXPECT_FALSE(finished);

  stalled->body->cancel();
  ioc.restart();
  ioc.run();
  EXPECT_TRUE(finished);
}

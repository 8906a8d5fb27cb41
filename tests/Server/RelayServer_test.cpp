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
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <thread>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <libfanrelay/server/server.hpp>

#include <Support/FakeFetcher.hpp>

namespace fs    = std::filesystem;
namespace beast = boost::beast;
namespace http  = beast::http;

using namespace fanrelay_test;
using json = nlohmann::json;

namespace
{

constexpr auto FEED_URL   = "https://feed.example/fancode.json";
constexpr auto MASTER_URL = "https://cdn.example/a/master.m3u8";

constexpr auto FEED = R"({"matches":[
  {"match_id":9,"status":"LIVE","adfree_stream":"https://cdn.example/a/master.m3u8"}
]})";

using Response = http::response<http::string_body>;

class RelayServerTest : public ::testing::Test
{
protected:
  asio::io_context                     client_ioc;
  FakeFetcher*                         fetcher = nullptr;
  std::unique_ptr<server::RelayServer> relay;
  std::thread                          runner;
  fs::path                             public_dir;
  uint                                 threads = 2;

  void SetUp() override
  {
    public_dir = fs::temp_directory_path() /
                 ("fanrelay_server_" + std::to_string(::testing::UnitTest::GetInstance()
                                                        ->random_seed()));
    fs::create_directories(public_dir);
    std::ofstream(public_dir / "main.html") << "<html>main</html>";

    config::AppConfig cfg;
    cfg.server.bind_address = "127.0.0.1";
    cfg.server.port         = 0;
    cfg.server.threads      = threads;
    cfg.server.public_dir   = public_dir.string();
    cfg.upstream.feed_url   = FEED_URL;

    auto fake = std::make_unique<FakeFetcher>();
    fetcher   = fake.get();
    fetcher->serve(FEED_URL, 200, FEED, "application/json");
    fetcher->serve(MASTER_URL, 200, "#EXTM3U\nchunk1.ts\n", "application/vnd.apple.mpegurl");

    relay  = std::make_unique<server::RelayServer>(cfg, std::move(fake));
    runner = std::thread([this] { relay->run(); });
  }

  void TearDown() override
  {
    relay->stop();
    if (runner.joinable())
      runner.join();
    relay.reset();

    std::error_code ec;
    fs::remove_all(public_dir, ec);
  }

  auto connect() -> beast::tcp_stream
  {
    beast::tcp_stream stream(client_ioc);
    stream.connect(tcp::endpoint{asio::ip::make_address("127.0.0.1"), relay->port()});
    return stream;
  }

  static auto request(beast::tcp_stream& stream, beast::flat_buffer& buffer,
                      const std::string& target) -> Response
  {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);

    http::response_parser<http::string_body> parser;
    parser.body_limit(boost::none);
    http::read(stream, buffer, parser);
    return parser.release();
  }

  auto get(const std::string& target) -> Response
  {
    auto               stream = connect();
    beast::flat_buffer buffer;
    return request(stream, buffer, target);
  }
};

// One io thread for everything, so any blocking call in the request path shows up as a stall
class SingleThreadRelayServerTest : public RelayServerTest
{
protected:
  SingleThreadRelayServerTest() { threads = 1; }
};

// Polls `pred` for up to five seconds
template <typename Pred> auto eventually(Pred pred) -> bool
{
  for (int i = 0; i < 100; ++i)
  {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return pred();
}

} // namespace

TEST_F(RelayServerTest, ServesCatalogOverHttp)
{
  const auto res = get("/matches");
  EXPECT_EQ(res.result_int(), 200u);
  EXPECT_EQ(json::parse(res.body())["total_matches"], 1);
}

TEST_F(RelayServerTest, KeepsConnectionAliveAcrossRequests)
{
  auto               stream = connect();
  beast::flat_buffer buffer;

  const auto playlist = request(stream, buffer, "/relay/9");
  EXPECT_EQ(playlist.result_int(), 200u);
  EXPECT_NE(playlist.body().find("/relay/9/chunk1.ts"), std::string::npos);

  const auto health = request(stream, buffer, "/health");
  EXPECT_EQ(health.result_int(), 200u);
}

TEST_F(RelayServerTest, StreamsSegmentWithLength)
{
  ScriptedResponse seg;
  seg.body         = std::string(300'000, 't');
  seg.content_type = "video/mp2t";
  seg.max_read     = 8192;
  fetcher->serve("https://cdn.example/a/chunk1.ts", seg);

  ASSERT_EQ(get("/relay/9").result_int(), 200u);

  const auto res = get("/relay/9/chunk1.ts");
  EXPECT_EQ(res.result_int(), 200u);
  EXPECT_EQ(res[http::field::content_type], "video/mp2t");
  EXPECT_EQ(res[http::field::content_length], "300000");
  EXPECT_EQ(res.body().size(), 300'000u);
  EXPECT_EQ(relay->metrics().bytes_relayed.load(), 300'000u);
}

TEST_F(RelayServerTest, StreamsSegmentChunkedWithoutLength)
{
  ScriptedResponse seg;
  seg.body        = std::string(50'000, 'c');
  seg.send_length = false;
  seg.max_read    = 4096;
  fetcher->serve("https://cdn.example/a/chunk1.ts", seg);

  ASSERT_EQ(get("/relay/9").result_int(), 200u);

  const auto res = get("/relay/9/chunk1.ts");
  EXPECT_EQ(res.result_int(), 200u);
  EXPECT_TRUE(res.chunked());
  EXPECT_EQ(res.body(), std::string(50'000, 'c'));
}

TEST_F(RelayServerTest, ClientDisconnectCancelsOrigin)
{
  ScriptedResponse seg;
  seg.body     = std::string(32 * 1024 * 1024, 'x');
  seg.max_read = 16 * 1024;
  fetcher->serve("https://cdn.example/a/chunk1.ts", seg);

  ASSERT_EQ(get("/relay/9").result_int(), 200u);

  {
    auto                            stream = connect();
    http::request<http::empty_body> req{http::verb::get, "/relay/9/chunk1.ts", 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);

    beast::flat_buffer                      buffer;
    http::response_parser<http::empty_body> parser;
    http::read_header(stream, buffer, parser);
    EXPECT_EQ(parser.get().result_int(), 200u);
    // Leaves without reading the body
  }

  const auto trace = fetcher->last_trace();
  ASSERT_NE(trace, nullptr);
  EXPECT_TRUE(eventually([&] { return trace->cancelled.load(); }));
  EXPECT_LT(trace->delivered.load(), 32u * 1024 * 1024);
  EXPECT_TRUE(eventually([&] { return relay->metrics().streams_cancelled.load() == 1; }));
}

TEST_F(SingleThreadRelayServerTest, StalledSegmentDoesNotHoldUpOtherRequests)
{
  ScriptedResponse seg;
  seg.body        = "first bytes";
  seg.send_length = false;
  seg.stall       = true;
  fetcher->serve("https://cdn.example/a/chunk1.ts", seg);

  ASSERT_EQ(get("/relay/9").result_int(), 200u);

  auto                            stalled = connect();
  http::request<http::empty_body> req{http::verb::get, "/relay/9/chunk1.ts", 11};
  req.set(http::field::host, "127.0.0.1");
  http::write(stalled, req);

  beast::flat_buffer                      buffer;
  http::response_parser<http::empty_body> parser;
  http::read_header(stalled, buffer, parser);
  ASSERT_EQ(parser.get().result_int(), 200u);
  const auto trace = fetcher->last_trace();
  ASSERT_NE(trace, nullptr);
  ASSERT_TRUE(eventually([&] { return trace->delivered.load() == seg.body.size(); }));

  const auto started = std::chrono::steady_clock::now();
  const auto res     = get("/matches");
  EXPECT_EQ(res.result_int(), 200u);
  EXPECT_EQ(json::parse(res.body())["total_matches"], 1);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));

  // The segment is still open and its origin untouched
  EXPECT_FALSE(trace->cancelled.load());
  EXPECT_EQ(relay->metrics().streams_cancelled.load(), 0u);
}

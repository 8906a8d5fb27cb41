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

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

#include <libfanrelay/config/config.hpp>

#include <Support/Argv.hpp>

namespace fs = std::filesystem;

using namespace libfanrelay;
using namespace libfanrelay::config;
using fanrelay_test::Argv;
using utils::cmdline::CmdLineParser;

namespace
{

auto write_temp_toml(const std::string& name, const std::string& text) -> std::string
{
  const auto path = fs::temp_directory_path() / name;
  std::ofstream(path) << text;
  return path.string();
}

auto parse(const Argv& argv) -> CmdLineParser
{
  CmdLineParser cli(argv.span());
  register_cli_args(cli);
  return cli;
}

} // namespace

TEST(Config, DefaultsMatchDocumentedValues)
{
  const AppConfig cfg;
  EXPECT_EQ(cfg.server.bind_address, "0.0.0.0");
  EXPECT_EQ(cfg.server.port, 3000);
  EXPECT_EQ(cfg.server.threads, 4u);
  EXPECT_EQ(cfg.server.public_dir, "public");
  EXPECT_EQ(cfg.upstream.user_agent, "Mozilla/5.0");
  EXPECT_TRUE(cfg.upstream.verify_tls);
  EXPECT_EQ(cfg.catalog.ttl, Seconds(30));
  EXPECT_EQ(cfg.catalog.fetch_timeout, Seconds(5));
  EXPECT_EQ(cfg.relay.fetch_timeout, Seconds(10));
  EXPECT_NO_THROW(validate(cfg));
}

TEST(Config, TomlOverridesDefaults)
{
  AppConfig cfg;
  apply_toml_string(R"(
    [server]
    port = 8081
    threads = 8

    [upstream]
    feed_url = "http://feed.local/matches.json"
    verify_tls = false

    [catalog]
    ttl_secs = 60

    [relay]
    fetch_timeout_secs = 3
  )",
                    cfg);

  EXPECT_EQ(cfg.server.port, 8081);
  EXPECT_EQ(cfg.server.threads, 8u);
  EXPECT_EQ(cfg.server.bind_address, "0.0.0.0");
  EXPECT_EQ(cfg.upstream.feed_url, "http://feed.local/matches.json");
  EXPECT_FALSE(cfg.upstream.verify_tls);
  EXPECT_EQ(cfg.catalog.ttl, Seconds(60));
  EXPECT_EQ(cfg.catalog.fetch_timeout, Seconds(5));
  EXPECT_EQ(cfg.relay.fetch_timeout, Seconds(3));
}

TEST(Config, TomlTypeAndRangeErrors)
{
  AppConfig cfg;
  EXPECT_THROW(apply_toml_string("[server]\nport = \"80\"\n", cfg), ConfigError);
  EXPECT_THROW(apply_toml_string("[server]\nport = 0\n", cfg), ConfigError);
  EXPECT_THROW(apply_toml_string("[server]\nport = 70000\n", cfg), ConfigError);
  EXPECT_THROW(apply_toml_string("[catalog]\nttl_secs = -1\n", cfg), ConfigError);
  EXPECT_THROW(apply_toml_string("[upstream]\nverify_tls = \"yes\"\n", cfg), ConfigError);
  EXPECT_THROW(apply_toml_string("[server\nport = 1\n", cfg), ConfigError);
}

TEST(Config, FlagsWinOverFile)
{
  const auto path = write_temp_toml("fanrelay_flags_test.toml", "[server]\nport = 4000\n"
                                                                "[catalog]\nttl_secs = 45\n");
  const Argv argv{"--config=" + path, "--port=5000", "--cache-ttl=15",
                  "--validation-timeout=2", "--user-agent=TestAgent/1.0"};
  const auto cli = parse(argv);

  const auto cfg = load(cli);
  EXPECT_EQ(cfg.server.port, 5000);
  EXPECT_EQ(cfg.catalog.ttl, Seconds(15));
  EXPECT_EQ(cfg.relay.fetch_timeout, Seconds(2));
  EXPECT_EQ(cfg.upstream.user_agent, "TestAgent/1.0");
  EXPECT_EQ(cfg.source_file, path);

  const auto opts = cfg.catalog_options();
  EXPECT_EQ(opts.ttl, Seconds(15));
  EXPECT_EQ(opts.user_agent, "TestAgent/1.0");
  EXPECT_EQ(cfg.relay_options().timeout, Milliseconds(2000));

  fs::remove(path);
}

TEST(Config, ExplicitConfigMustExist)
{
  const Argv argv{"--config=/nonexistent/fanrelay.toml"};
  const auto cli = parse(argv);
  EXPECT_THROW((void)load(cli), ConfigError);
}

TEST(Config, InvalidValuesAreRejectedAtLoad)
{
  const auto path = write_temp_toml("fanrelay_empty_test.toml", "");

  for (const auto* flag : {"--port=0", "--cache-ttl=0", "--fetch-timeout=-5", "--threads=0",
                           "--feed-url=not-a-url", "--bind=localhost", "--user-agent="})
  {
    const Argv argv{"--config=" + path, flag};
    const auto cli = parse(argv);
    EXPECT_THROW((void)load(cli), ConfigError) << flag;
  }

  fs::remove(path);
}

TEST(Config, DescribeMentionsEffectiveSettings)
{
  AppConfig cfg;
  cfg.server.port = 9999;
  const auto text = describe(cfg);
  EXPECT_NE(text.find("9999"), std::string::npos);
  EXPECT_NE(text.find("ttl=30s"), std::string::npos);
}

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

#include <boost/asio/ip/address.hpp>
#include <filesystem>
#include <format>
#include <toml++/toml.hpp>

#include <libfanrelay/common/error.hpp>
#include <libfanrelay/config/config.hpp>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/network/url.hpp>

namespace fs = std::filesystem;

using ConfigLog = libfanrelay::log::CONFIG;

namespace libfanrelay::config
{

namespace
{

auto key_name(std::string_view section, std::string_view key) -> std::string
{
  return std::format("{}.{}", section, key);
}

auto toml_string(const toml::table& root, std::string_view section, std::string_view key)
  -> std::optional<std::string>
{
  const auto node = root[section][key];
  if (!node)
    return std::nullopt;
  if (!node.is_string())
    throw ConfigError(key_name(section, key) + " must be a string");
  return node.value<std::string>();
}

auto toml_int(const toml::table& root, std::string_view section, std::string_view key)
  -> std::optional<i64>
{
  const auto node = root[section][key];
  if (!node)
    return std::nullopt;
  if (!node.is_integer())
    throw ConfigError(key_name(section, key) + " must be an integer");
  return node.value<i64>();
}

auto toml_bool(const toml::table& root, std::string_view section, std::string_view key)
  -> std::optional<bool>
{
  const auto node = root[section][key];
  if (!node)
    return std::nullopt;
  if (!node.is_boolean())
    throw ConfigError(key_name(section, key) + " must be true or false");
  return node.value<bool>();
}

auto checked_port(i64 value, std::string_view what) -> PortNo
{
  if (value <= 0 || value > 65535)
    throw ConfigError(std::format("{} must be within 1..65535, got {}", what, value));
  return static_cast<PortNo>(value);
}

auto checked_threads(i64 value, std::string_view what) -> uint
{
  if (value < 1 || value > 1024)
    throw ConfigError(std::format("{} must be within 1..1024, got {}", what, value));
  return static_cast<uint>(value);
}

auto checked_secs(i64 value, std::string_view what) -> Seconds
{
  if (value <= 0)
    throw ConfigError(std::format("{} must be a positive number of seconds, got {}", what, value));
  return Seconds(value);
}

void apply_table(const toml::table& root, AppConfig& cfg)
{
  namespace S = TomlKeys::Server;
  namespace U = TomlKeys::Upstream;
  namespace C = TomlKeys::Catalog;
  namespace R = TomlKeys::Relay;

  if (auto v = toml_string(root, S::Root, S::BindAddress))
    cfg.server.bind_address = *v;
  if (auto v = toml_int(root, S::Root, S::Port))
    cfg.server.port = checked_port(*v, key_name(S::Root, S::Port));
  if (auto v = toml_int(root, S::Root, S::Threads))
    cfg.server.threads = checked_threads(*v, key_name(S::Root, S::Threads));
  if (auto v = toml_string(root, S::Root, S::PublicDir))
    cfg.server.public_dir = *v;

  if (auto v = toml_string(root, U::Root, U::FeedUrl))
    cfg.upstream.feed_url = *v;
  if (auto v = toml_string(root, U::Root, U::UserAgent))
    cfg.upstream.user_agent = *v;
  if (auto v = toml_bool(root, U::Root, U::VerifyTls))
    cfg.upstream.verify_tls = *v;

  if (auto v = toml_int(root, C::Root, C::TtlSecs))
    cfg.catalog.ttl = checked_secs(*v, key_name(C::Root, C::TtlSecs));
  if (auto v = toml_int(root, C::Root, C::FetchTimeout))
    cfg.catalog.fetch_timeout = checked_secs(*v, key_name(C::Root, C::FetchTimeout));

  if (auto v = toml_int(root, R::Root, R::FetchTimeout))
    cfg.relay.fetch_timeout = checked_secs(*v, key_name(R::Root, R::FetchTimeout));
}

} // namespace

auto AppConfig::catalog_options() const -> catalog::CatalogOptions
{
  catalog::CatalogOptions out;
  out.feed_url      = upstream.feed_url;
  out.ttl           = catalog.ttl;
  out.fetch_timeout = catalog.fetch_timeout;
  out.user_agent    = upstream.user_agent;
  return out;
}

auto AppConfig::relay_options() const -> relay::RelayOptions
{
  relay::RelayOptions out;
  out.timeout    = relay.fetch_timeout;
  out.user_agent = upstream.user_agent;
  return out;
}

void register_cli_args(utils::cmdline::CmdLineParser& cli)
{
  cli.register_args({
    {Flags::Config, "path", "TOML configuration file (default: ./fanrelay.toml when present)"},
    {Flags::Bind, "address", "Address to listen on (default: 0.0.0.0)"},
    {Flags::Port, "port", "Port to listen on (default: 3000)"},
    {Flags::Threads, "count", "Threads running the event loop (default: 4)"},
    {Flags::PublicDir, "dir", "Directory with main.html and player.html (default: public)"},
    {Flags::FeedUrl, "url", "Upstream match feed (JSON)"},
    {Flags::UserAgent, "ua", "User-Agent sent to every origin (default: Mozilla/5.0)"},
    {Flags::VerifyTls, "bool", "Verify origin TLS certificates (default: true)"},
    {Flags::CacheTtl, "secs", "Match catalog time to live (default: 30)"},
    {Flags::FetchTimeout, "secs", "Match feed fetch timeout (default: 5)"},
    {Flags::ValidationTimeout, "secs", "Playlist and segment fetch timeout (default: 10)"},
    {"help", "", "Print this message"},
  });
}

void apply_toml_string(std::string_view text, AppConfig& cfg)
{
  try
  {
    const toml::table root = toml::parse(text);
    apply_table(root, cfg);
  }
  catch (const toml::parse_error& e)
  {
    throw ConfigError(std::format("invalid TOML: {}", e.description()));
  }
}

void apply_toml_file(const AbsPath& path, AppConfig& cfg)
{
  try
  {
    const toml::table root = toml::parse_file(path);
    apply_table(root, cfg);
  }
  catch (const toml::parse_error& e)
  {
    throw ConfigError(std::format("{}: {}", path, e.description()));
  }

  cfg.source_file = path;
  log::INFO<ConfigLog>("Applied configuration file {}", path);
}

void apply_cli(const utils::cmdline::CmdLineParser& cli, AppConfig& cfg)
{
  if (auto v = cli.get<std::string>(Flags::Bind))
    cfg.server.bind_address = *v;
  if (auto v = cli.get<i64>(Flags::Port))
    cfg.server.port = checked_port(*v, "--port");
  if (auto v = cli.get<i64>(Flags::Threads))
    cfg.server.threads = checked_threads(*v, "--threads");
  if (auto v = cli.get<std::string>(Flags::PublicDir))
    cfg.server.public_dir = *v;

  if (auto v = cli.get<std::string>(Flags::FeedUrl))
    cfg.upstream.feed_url = *v;
  if (auto v = cli.get<std::string>(Flags::UserAgent))
    cfg.upstream.user_agent = *v;
  if (auto v = cli.get<bool>(Flags::VerifyTls))
    cfg.upstream.verify_tls = *v;

  if (auto v = cli.get<i64>(Flags::CacheTtl))
    cfg.catalog.ttl = checked_secs(*v, "--cache-ttl");
  if (auto v = cli.get<i64>(Flags::FetchTimeout))
    cfg.catalog.fetch_timeout = checked_secs(*v, "--fetch-timeout");
  if (auto v = cli.get<i64>(Flags::ValidationTimeout))
    cfg.relay.fetch_timeout = checked_secs(*v, "--validation-timeout");
}

void validate(const AppConfig& cfg)
{
  boost::system::error_code ec;
  boost::asio::ip::make_address(cfg.server.bind_address, ec);
  if (ec)
    throw ConfigError("bind address '" + cfg.server.bind_address + "' is not an IP address");

  if (cfg.server.public_dir.empty())
    throw ConfigError("public directory must not be empty");

  if (!network::is_absolute_http_url(cfg.upstream.feed_url))
    throw ConfigError("feed URL '" + cfg.upstream.feed_url + "' is not an absolute http(s) URL");

  if (cfg.upstream.user_agent.empty())
    throw ConfigError("user agent must not be empty");
}

auto load(const utils::cmdline::CmdLineParser& cli) -> AppConfig
{
  AppConfig cfg;

  if (auto path = cli.get<std::string>(Flags::Config))
  {
    if (!fs::is_regular_file(*path))
      throw ConfigError("config file '" + *path + "' does not exist");
    apply_toml_file(*path, cfg);
  }
  else if (const auto fallback = macros::to_string(macros::DEFAULT_CONFIG_FILE);
           fs::is_regular_file(fallback))
  {
    apply_toml_file(fallback, cfg);
  }
  else
  {
    log::DBG<ConfigLog>("No {} in the working directory, using defaults",
                        macros::DEFAULT_CONFIG_FILE);
  }

  apply_cli(cli, cfg);
  validate(cfg);
  return cfg;
}

auto describe(const AppConfig& cfg) -> std::string
{
  return std::format("listen={}:{} threads={} public_dir={} feed={} verify_tls={} ttl={}s "
                     "catalog_timeout={}s relay_timeout={}s",
                     cfg.server.bind_address, cfg.server.port, cfg.server.threads,
                     cfg.server.public_dir, cfg.upstream.feed_url, cfg.upstream.verify_tls,
                     cfg.catalog.ttl.count(), cfg.catalog.fetch_timeout.count(),
                     cfg.relay.fetch_timeout.count());
}

} // namespace libfanrelay::config

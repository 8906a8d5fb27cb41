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

#include <optional>
#include <string>
#include <string_view>

#include <libfanrelay/catalog/catalog.hpp>
#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/common/types.hpp>
#include <libfanrelay/relay/playlist-relay.hpp>
#include <libfanrelay/utils/cmd-line/parser.hpp>

/*
 * @CONFIGURATION
 *
 * Process-wide, fixed at startup. Later sources win:
 *
 *   built-in defaults  <  TOML file  <  command-line flags
 *
 *   [server]    bind_address, port, threads, public_dir
 *   [upstream]  feed_url, user_agent, verify_tls
 *   [catalog]   ttl_secs, fetch_timeout_secs
 *   [relay]     fetch_timeout_secs
 *
 * The TOML file is --config=<path> (must exist) or ./fanrelay.toml when present.
 * Anything out of range or of the wrong type is a ConfigError.
 *
 */

namespace libfanrelay::config
{

namespace TomlKeys
{
namespace Server
{
inline constexpr std::string_view Root        = "server";
inline constexpr std::string_view BindAddress = "bind_address";
inline constexpr std::string_view Port        = "port";
inline constexpr std::string_view Threads     = "threads";
inline constexpr std::string_view PublicDir   = "public_dir";
} // namespace Server

namespace Upstream
{
inline constexpr std::string_view Root      = "upstream";
inline constexpr std::string_view FeedUrl   = "feed_url";
inline constexpr std::string_view UserAgent = "user_agent";
inline constexpr std::string_view VerifyTls = "verify_tls";
} // namespace Upstream

namespace Catalog
{
inline constexpr std::string_view Root         = "catalog";
inline constexpr std::string_view TtlSecs      = "ttl_secs";
inline constexpr std::string_view FetchTimeout = "fetch_timeout_secs";
} // namespace Catalog

namespace Relay
{
inline constexpr std::string_view Root         = "relay";
inline constexpr std::string_view FetchTimeout = "fetch_timeout_secs";
} // namespace Relay
} // namespace TomlKeys

namespace Flags
{
inline constexpr auto Config            = "config";
inline constexpr auto Bind              = "bind";
inline constexpr auto Port              = "port";
inline constexpr auto Threads           = "threads";
inline constexpr auto PublicDir         = "public-dir";
inline constexpr auto FeedUrl           = "feed-url";
inline constexpr auto UserAgent         = "user-agent";
inline constexpr auto VerifyTls         = "verify-tls";
inline constexpr auto CacheTtl          = "cache-ttl";
inline constexpr auto FetchTimeout      = "fetch-timeout";
inline constexpr auto ValidationTimeout = "validation-timeout";
} // namespace Flags

struct ServerConfig
{
  IPAddr    bind_address = macros::to_string(macros::DEFAULT_BIND_ADDRESS);
  PortNo    port         = FANRELAY_DEFAULT_PORT_NO;
  uint      threads      = FANRELAY_DEFAULT_IO_THREADS;
  Directory public_dir   = macros::to_string(macros::DEFAULT_PUBLIC_DIR);
};

struct UpstreamConfig
{
  AbsURL    feed_url   = macros::to_string(macros::DEFAULT_FEED_URL);
  UserAgent user_agent = macros::to_string(macros::DEFAULT_USER_AGENT);
  bool      verify_tls = true;
};

struct CatalogConfig
{
  Seconds ttl{FANRELAY_CATALOG_TTL_SECS};
  Seconds fetch_timeout{FANRELAY_CATALOG_TIMEOUT_SECS};
};

struct RelayConfig
{
  Seconds fetch_timeout{FANRELAY_RELAY_TIMEOUT_SECS};
};

struct AppConfig
{
  ServerConfig           server;
  UpstreamConfig         upstream;
  CatalogConfig          catalog;
  RelayConfig            relay;
  std::optional<AbsPath> source_file; // TOML file that was applied, if any

  [[nodiscard]] auto catalog_options() const -> catalog::CatalogOptions;
  [[nodiscard]] auto relay_options() const -> relay::RelayOptions;
};

FANRELAY_API void register_cli_args(utils::cmdline::CmdLineParser& cli);

FANRELAY_API void apply_toml_string(std::string_view text, AppConfig& cfg);
FANRELAY_API void apply_toml_file(const AbsPath& path, AppConfig& cfg);
FANRELAY_API void apply_cli(const utils::cmdline::CmdLineParser& cli, AppConfig& cfg);

// Checks the cross-field rules that a single key cannot
FANRELAY_API void validate(const AppConfig& cfg);

// defaults <- TOML <- flags, validated
FANRELAY_API auto load(const utils::cmdline::CmdLineParser& cli) -> AppConfig;

FANRELAY_API auto describe(const AppConfig& cfg) -> std::string;

} // namespace libfanrelay::config

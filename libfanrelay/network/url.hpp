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

#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

/*
 * URL helpers for the relay
 *
 * Only absolute http:// and https:// URLs are understood. Anything the relay forwards to an
 * origin goes through parse_url() first, so a stream URL that does not parse is treated the
 * same way as one that is not a playlist.
 *
 *   https://cdn.example:8443/live/a/master.m3u8?tok=1
 *   \___/   \_________/ \__/\______________________/
 *  scheme      host     port         target
 *
 */

namespace libfanrelay::network
{

struct Url
{
  std::string scheme; // lowercase, "http" or "https"
  std::string host;   // without brackets for IPv6 literals
  PortNo      port = 0;
  NetTarget   target; // path + query, always starts with '/'

  [[nodiscard]] auto is_tls() const noexcept -> bool { return scheme == "https"; }
  [[nodiscard]] auto default_port() const noexcept -> bool
  {
    return port == (is_tls() ? 443 : 80);
  }

  // scheme://host[:port], the port is only spelled out when it is not the default one
  [[nodiscard]] auto origin() const -> std::string;
  // Value for the Host header
  [[nodiscard]] auto host_header() const -> std::string;
  [[nodiscard]] auto str() const -> AbsURL { return origin() + target; }
};

FANRELAY_API auto parse_url(std::string_view url) -> std::optional<Url>;

FANRELAY_API auto is_absolute_http_url(std::string_view url) -> bool;

// "https://cdn/a/b/master.m3u8?x=1" -> "https://cdn/a/b/"
FANRELAY_API auto base_directory_url(std::string_view url) -> BaseURL;

// True when any path segment decodes to "..", both '/' and '\' count as separators
FANRELAY_API auto has_parent_traversal(std::string_view rel_path) -> bool;

FANRELAY_API auto same_origin(const Url& a, const Url& b) -> bool;

// Splits "a/b.ts?x=1" into the path part and the query part ("?x=1")
FANRELAY_API auto split_query(std::string_view target)
  -> std::pair<std::string_view, std::string_view>;

FANRELAY_API auto percent_decode(std::string_view in) -> std::string;

// Escapes everything but RFC 3986 unreserved characters, so the result is one path segment
FANRELAY_API auto percent_encode_segment(std::string_view in) -> std::string;

} // namespace libfanrelay::network

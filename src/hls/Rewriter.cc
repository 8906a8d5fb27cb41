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

#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/common/network/routes.h>
#include <libfanrelay/hls/rewriter.hpp>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/network/url.hpp>

using M3U8 = libfanrelay::log::M3U8;

namespace libfanrelay::hls
{

namespace
{

constexpr std::string_view WHITESPACE = " \t\f\v";

// Appends one URI line to `out`, relay-prefixed when relayable. Returns whether it changed
auto rewrite_uri_line(std::string_view line, std::string_view match_id, std::string& out) -> bool
{
  const auto first = line.find_first_not_of(WHITESPACE);
  const auto last  = line.find_last_not_of(WHITESPACE);
  const auto token = line.substr(first, last - first + 1);

  if (!is_relayable_uri(token))
  {
    out.append(line);
    return false;
  }

  out.append(line.substr(0, first));
  out.append(relay_path(match_id, token));
  out.append(line.substr(last + 1));
  return true;
}

// Appends a tag line with its URI="..." attributes rewritten, returns how many changed
auto rewrite_tag_line(std::string_view line, std::string_view match_id, std::string& out) -> int
{
  int         changed = 0;
  std::size_t pos     = 0;

  while (true)
  {
    const auto attr = line.find(macros::PLAYLIST_URI_ATTR, pos);
    if (attr == std::string_view::npos)
      break;

    const auto value_start = attr + macros::PLAYLIST_URI_ATTR.size();
    const auto value_end   = line.find('"', value_start);
    if (value_end == std::string_view::npos)
      break; // unterminated, leave the remainder as is

    out.append(line.substr(pos, value_start - pos));

    const auto value = line.substr(value_start, value_end - value_start);
    if (is_relayable_uri(value))
    {
      out.append(relay_path(match_id, value));
      ++changed;
    }
    else
      out.append(value);

    pos = value_end;
  }

  out.append(line.substr(pos));
  return changed;
}

} // namespace

auto is_relayable_uri(std::string_view uri) -> bool
{
  const auto path = network::split_query(uri).first;
  return path.ends_with(macros::PLAYLIST_EXT) || path.ends_with(macros::TRANSPORT_STREAM_EXT);
}

auto relay_path(std::string_view match_id, std::string_view uri) -> std::string
{
  const std::string id = network::percent_encode_segment(match_id);

  std::string out;
  out.reserve(routes::SERVER_PATH_RELAY.size() + id.size() + 1 + uri.size());
  out.append(routes::SERVER_PATH_RELAY);
  out.append(id);
  out.push_back('/');
  out.append(uri);
  return out;
}

auto rewrite_playlist(std::string_view playlist, std::string_view match_id) -> PlaylistData
{
  PlaylistData out;
  out.reserve(playlist.size() + playlist.size() / 4);

  int         rewritten = 0;
  std::size_t start     = 0;

  while (start < playlist.size())
  {
    auto       nl     = playlist.find('\n', start);
    const bool has_nl = nl != std::string_view::npos;
    if (!has_nl)
      nl = playlist.size();

    std::string_view line = playlist.substr(start, nl - start);
    std::string_view eol  = has_nl ? "\n" : "";
    if (line.ends_with('\r'))
    {
      line.remove_suffix(1);
      eol = has_nl ? "\r\n" : "\r";
    }

    const auto first = line.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos)
      out.append(line);
    else if (line.substr(first).starts_with(macros::PLAYLIST_TAG_PREFIX))
      rewritten += rewrite_tag_line(line, match_id, out);
    else if (rewrite_uri_line(line, match_id, out))
      ++rewritten;

    out.append(eol);
    start = nl + 1;
  }

  log::TRACE<M3U8>(LogMode::Async, "Rewrote {} references for match {}", rewritten, match_id);
  return out;
}

} // namespace libfanrelay::hls

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
#include <libfanrelay/hls/rewriter.hpp>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/network/url.hpp>
#include <libfanrelay/relay/playlist-relay.hpp>

using Relay = libfanrelay::log::RELAY;

namespace libfanrelay::relay
{

namespace
{

void fail_later(const asio::any_io_executor& ex, PlaylistRelay::PlaylistHandler handler,
                RelayError err)
{
  asio::post(ex, [handler = std::move(handler), err = std::move(err)]
             { handler(std::make_exception_ptr(err), RewrittenPlaylist{}); });
}

} // namespace

void PlaylistRelay::async_get_master_playlist(asio::any_io_executor ex, const MatchID& match_id,
                                              std::string_view variant, PlaylistHandler handler)
{
  const auto cdn = catalog::parse_cdn_variant(variant);
  if (!cdn)
  {
    log::WARN<Relay>(LogMode::Async, "Unknown cdn variant '{}' requested for match {}", variant,
                     match_id);
    fail_later(ex, std::move(handler),
               RelayError(ErrorKind::NotFound, "Invalid or missing stream URL"));
    return;
  }

  m_catalog.async_get_stream_url(
    ex, match_id, *cdn,
    [this, ex, match_id, variant = std::string(variant),
     handler = std::move(handler)](std::exception_ptr err, AbsURL url)
    {
      if (err)
      {
        handler(err, RewrittenPlaylist{});
        return;
      }

      if (url.find(macros::PLAYLIST_EXT) == AbsURL::npos || !network::is_absolute_http_url(url))
      {
        log::WARN<Relay>(LogMode::Async, "Match {} [{}] has no usable playlist URL: {}",
                         match_id, variant, url);
        handler(std::make_exception_ptr(
                  RelayError(ErrorKind::InvalidStream, "Invalid or missing stream URL")),
                RewrittenPlaylist{});
        return;
      }

      log::INFO<Relay>(LogMode::Async,
                       "Validating and rewriting master playlist for match {} [{}]", match_id,
                       variant);

      m_fetcher.async_fetch_all(
        ex, url, m_opts.fetch_options(), FANRELAY_PLAYLIST_LIMIT_MIB * 1024 * 1024,
        [this, match_id, variant, url, handler](std::exception_ptr fetch_err,
                                                network::FetchResult res)
        { on_master(match_id, variant, url, fetch_err, std::move(res), handler); });
    });
}

void PlaylistRelay::on_master(const MatchID& match_id, const std::string& variant,
                              const AbsURL& url, std::exception_ptr err,
                              network::FetchResult res, const PlaylistHandler& handler)
{
  if (err)
  {
    log::ERROR<Relay>(LogMode::Async, "Master playlist fetch failed for match {} [{}] at {}: {}",
                      match_id, variant, url, describe(err));
    handler(err, RewrittenPlaylist{});
    return;
  }

  if (!res.ok())
  {
    log::ERROR<Relay>(LogMode::Async, "Master playlist for match {} [{}] at {} answered {}",
                      match_id, variant, url, res.status);
    handler(std::make_exception_ptr(RelayError(ErrorKind::UpstreamUnavailable,
                                               "Stream URL not accessible", res.status)),
            RewrittenPlaylist{});
    return;
  }

  RewrittenPlaylist out;
  out.origin_url = url;
  out.base_url   = network::base_directory_url(url);
  m_sessions.record(match_id, out.base_url);

  out.body = hls::rewrite_playlist(res.body, match_id);

  log::DBG<Relay>(LogMode::Async, "Match {} now relays from {} ({} bytes of playlist)", match_id,
                  out.base_url, out.body.size());
  handler(nullptr, std::move(out));
}

} // namespace libfanrelay::relay

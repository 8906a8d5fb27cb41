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

#include <exception>
#include <functional>

#include <libfanrelay/catalog/catalog.hpp>
#include <libfanrelay/network/fetcher.hpp>
#include <libfanrelay/relay/session-store.hpp>

/*
 * @PlaylistRelay
 *
 * GET /relay/{matchId}?cdn={variant}
 *
 *   catalog (refresh if stale) -> stream URL -> GET origin -> record base URL -> rewrite
 *
 * Every step is asynchronous on the executor the caller passes in, the handler gets either the
 * rewritten playlist or the RelayError that stopped it.
 *
 * Failure kinds, in the order they can happen:
 *
 *   NotFound            unknown match, unknown variant name, variant absent for the match
 *   InvalidStream       URL does not mention .m3u8 or is not absolute http(s)
 *   UpstreamError       transport fault / timeout (also from the catalog refresh)
 *   UpstreamUnavailable origin answered non-2xx
 *
 * The session entry is written only after a 2xx from the origin.
 *
 */

namespace libfanrelay::relay
{

namespace asio = boost::asio;

struct RelayOptions
{
  Milliseconds timeout{Seconds(FANRELAY_RELAY_TIMEOUT_SECS)};
  UserAgent    user_agent = macros::to_string(macros::DEFAULT_USER_AGENT);

  [[nodiscard]] auto fetch_options() const -> network::FetchOptions
  {
    network::FetchOptions opts;
    opts.timeout    = timeout;
    opts.user_agent = user_agent;
    return opts;
  }
};

struct RewrittenPlaylist
{
  PlaylistData body;
  ContentType  content_type = macros::to_string(macros::CONTENT_TYPE_M3U8);
  AbsURL       origin_url;
  BaseURL      base_url;
};

class FANRELAY_API PlaylistRelay
{
public:
  PlaylistRelay(catalog::MatchCatalog& catalog, RelaySessionStore& sessions,
                network::IUpstreamFetcher& fetcher, RelayOptions opts)
      : m_catalog(catalog), m_sessions(sessions), m_fetcher(fetcher), m_opts(std::move(opts))
  {
  }

  using PlaylistHandler = std::function<void(std::exception_ptr, RewrittenPlaylist)>;

  void async_get_master_playlist(asio::any_io_executor ex, const MatchID& match_id,
                                 std::string_view variant, PlaylistHandler handler);

private:
  catalog::MatchCatalog&     m_catalog;
  RelaySessionStore&         m_sessions;
  network::IUpstreamFetcher& m_fetcher;
  RelayOptions               m_opts;

  void on_master(const MatchID& match_id, const std::string& variant, const AbsURL& url,
                 std::exception_ptr err, network::FetchResult res,
                 const PlaylistHandler& handler);
};

} // namespace libfanrelay::relay

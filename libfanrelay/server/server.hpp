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

#include <boost/asio.hpp>
#include <memory>

#include <libfanrelay/catalog/catalog.hpp>
#include <libfanrelay/config/config.hpp>
#include <libfanrelay/network/fetcher.hpp>
#include <libfanrelay/relay/playlist-relay.hpp>
#include <libfanrelay/relay/segment-proxy.hpp>
#include <libfanrelay/relay/session-store.hpp>
#include <libfanrelay/server/handler.hpp>
#include <libfanrelay/server/metrics.hpp>

/*
 * @SERVER
 *
 * The relay's main responsibility the way we see it is:
 *
 * -> Serving the cached match catalog (/matches, /matches/{id})
 * -> Relaying a match's master playlist with every media reference pointed back at us
 * -> Streaming segments from the origin the master playlist came from
 * -> Serving the player pages out of the public directory
 *
 * `server.threads` threads run one io_context. Every connection gets its own strand, and the
 * origin fetches a request starts run as async ops on that same strand, so a slow origin only
 * ever holds its own connection back.
 *
 * SIGINT/SIGTERM stop accepting and stop the io_context. run() joins the extra threads before
 * returning, connections still open are dropped with it.
 *
 */

namespace asio = boost::asio;
using tcp      = asio::ip::tcp;

namespace libfanrelay::server
{

class FANRELAY_API RelayServer
{
public:
  explicit RelayServer(config::AppConfig cfg);
  RelayServer(config::AppConfig cfg, std::unique_ptr<network::IUpstreamFetcher> fetcher);
  ~RelayServer() = default;

  RelayServer(const RelayServer&)                    = delete;
  auto operator=(const RelayServer&) -> RelayServer& = delete;

  // Blocks until a signal or stop()
  void run();
  void stop();

  [[nodiscard]] auto port() const -> PortNo;
  [[nodiscard]] auto metrics() -> Metrics& { return m_metrics; }

private:
  config::AppConfig                          m_cfg;
  std::unique_ptr<network::IUpstreamFetcher> m_fetcher;
  Metrics                                    m_metrics;
  catalog::MatchCatalog                      m_catalog;
  relay::RelaySessionStore                   m_sessions;
  relay::PlaylistRelay                       m_playlists;
  relay::SegmentProxy                        m_segments;
  ApiHandler                                 m_handler;

  // Declared last: connections still queued here refer to everything above
  asio::io_context m_ioc;
  tcp::acceptor    m_acceptor;
  asio::signal_set m_signals;

  void open_acceptor();
  void do_accept();
};

} // namespace libfanrelay::server

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

#include <csignal>
#include <thread>
#include <vector>

#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/network/entry.hpp>
#include <libfanrelay/server/server.hpp>
#include <libfanrelay/server/session.hpp>

using Server = libfanrelay::log::SERVER;

namespace libfanrelay::server
{

RelayServer::RelayServer(config::AppConfig cfg)
    : RelayServer(cfg, std::make_unique<network::HttpsFetcher>(cfg.upstream.verify_tls))
{
}

RelayServer::RelayServer(config::AppConfig cfg, std::unique_ptr<network::IUpstreamFetcher> fetcher)
    : m_cfg(std::move(cfg)), m_fetcher(std::move(fetcher)),
      m_catalog(*m_fetcher, m_cfg.catalog_options()),
      m_playlists(m_catalog, m_sessions, *m_fetcher, m_cfg.relay_options()),
      m_segments(m_sessions, *m_fetcher, m_cfg.relay_options()),
      m_handler(HandlerContext{m_catalog, m_sessions, m_playlists, m_segments, m_metrics,
                               m_cfg.server.public_dir}),
      m_ioc(static_cast<int>(m_cfg.server.threads)), m_acceptor(m_ioc),
      m_signals(m_ioc, SIGINT, SIGTERM)
{
  open_acceptor();
}

void RelayServer::open_acceptor()
{
  try
  {
    const tcp::endpoint endpoint{asio::ip::make_address(m_cfg.server.bind_address),
                                 m_cfg.server.port};
    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(asio::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(asio::socket_base::max_listen_connections);
  }
  catch (const boost::system::system_error& e)
  {
    log::ERROR<Server>("Cannot listen on {}:{}: {}", m_cfg.server.bind_address,
                       m_cfg.server.port, e.what());
    throw;
  }
}

void RelayServer::run()
{
  m_signals.async_wait(
    [this](const boost::system::error_code& ec, int signo)
    {
      if (ec)
        return;
      log::INFO<Server>("Shutdown signal ({}) received. Stopping...", signo);
      stop();
    });

  do_accept();

  log::INFO<Server>("fanrelay listening on {}:{} ({} threads, public dir '{}')",
                    m_cfg.server.bind_address, port(), m_cfg.server.threads,
                    m_cfg.server.public_dir);

  std::vector<std::thread> extra;
  extra.reserve(m_cfg.server.threads - 1);
  for (std::size_t i = 1; i < m_cfg.server.threads; ++i)
    extra.emplace_back([this] { m_ioc.run(); });

  m_ioc.run();

  for (auto& thread : extra)
    thread.join();
  log::INFO<Server>("Server stopped after serving {} requests", m_metrics.total_requests.load());
}

void RelayServer::stop()
{
  asio::post(m_ioc,
             [this]
             {
               boost::system::error_code ec;
               m_acceptor.close(ec);
               m_signals.cancel(ec);
               m_ioc.stop();
             });
}

auto RelayServer::port() const -> PortNo
{
  boost::system::error_code ec;
  const auto                endpoint = m_acceptor.local_endpoint(ec);
  return ec ? m_cfg.server.port : endpoint.port();
}

void RelayServer::do_accept()
{
  m_acceptor.async_accept(
    asio::make_strand(m_ioc),
    [this](boost::system::error_code ec, tcp::socket socket)
    {
      if (ec == asio::error::operation_aborted)
        return;

      if (ec)
        log::ERROR<Server>(LogMode::Async, "Accept failed: {}", ec.message());
      else
        std::make_shared<HttpSession>(std::move(socket), m_handler, m_metrics)->start();

      if (m_acceptor.is_open())
        do_accept();
    });
}

} // namespace libfanrelay::server

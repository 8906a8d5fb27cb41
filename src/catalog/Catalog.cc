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

#include <libfanrelay/catalog/catalog.hpp>
#include <libfanrelay/common/error.hpp>
#include <libfanrelay/log-macros.hpp>

using Catalog = libfanrelay::log::CATALOG;

namespace libfanrelay::catalog
{

namespace
{

auto lookup(const Snapshot& snap, std::string_view match_id) -> const Match&
{
  const auto match = snap.find(match_id);
  if (!match)
    throw RelayError(ErrorKind::NotFound, "Match not found");
  return *match;
}

} // namespace

MatchCatalog::MatchCatalog(network::IUpstreamFetcher& fetcher, CatalogOptions opts, Clock clock)
    : m_fetcher(fetcher), m_opts(std::move(opts)), m_clock(std::move(clock))
{
}

auto MatchCatalog::stale_at(const Snapshot& snap, TimePoint now) const -> bool
{
  return now - snap.fetched_at >= m_opts.ttl;
}

auto MatchCatalog::cached() const -> SnapshotPtr
{
  std::shared_lock lock(m_mutex);
  return m_snapshot;
}

auto MatchCatalog::is_stale() const -> bool
{
  const auto snap = cached();
  return !snap || stale_at(*snap, m_clock());
}

void MatchCatalog::async_snapshot(asio::any_io_executor ex, SnapshotHandler handler)
{
  const TimePoint now = m_clock();
  {
    std::shared_lock lock(m_mutex);
    if (m_snapshot && !stale_at(*m_snapshot, now))
    {
      asio::post(ex, [snap = m_snapshot, handler = std::move(handler)] { handler(nullptr, snap); });
      return;
    }
  }

  m_fetches.fetch_add(1);
  log::DBG<Catalog>(LogMode::Async, "Refreshing match feed from {}", m_opts.feed_url);

  network::FetchOptions opts;
  opts.timeout    = m_opts.fetch_timeout;
  opts.user_agent = m_opts.user_agent;

  m_fetcher.async_fetch_all(
    ex, m_opts.feed_url, opts, FANRELAY_UPSTREAM_JSON_LIMIT_MIB * 1024 * 1024,
    [this, now, handler = std::move(handler)](std::exception_ptr err, network::FetchResult res)
    {
      if (err)
      {
        log::ERROR<Catalog>(LogMode::Async, "Feed {} could not be fetched: {}", m_opts.feed_url,
                            describe(err));
        handler(err, nullptr);
        return;
      }

      SnapshotPtr installed;
      try
      {
        installed = install(parse_feed(res, now));
      }
      catch (const RelayError&)
      {
        err = std::current_exception();
      }
      handler(err, installed);
    });
}

auto MatchCatalog::parse_feed(const network::FetchResult& res, TimePoint started) const
  -> SnapshotPtr
{
  if (!res.ok())
  {
    log::ERROR<Catalog>(LogMode::Async, "Feed {} answered with status {}", m_opts.feed_url,
                        res.status);
    throw RelayError(ErrorKind::UpstreamError, "match feed answered with a non-2xx status",
                     res.status);
  }

  json feed = json::parse(res.body, nullptr, false);
  if (feed.is_discarded())
  {
    log::ERROR<Catalog>(LogMode::Async, "Feed {} returned invalid JSON ({} bytes)",
                        m_opts.feed_url, res.body.size());
    throw RelayError(ErrorKind::MalformedUpstreamData, "Invalid JSON in match feed");
  }
  if (!feed.is_object())
  {
    log::ERROR<Catalog>(LogMode::Async, "Feed {} root is a {}, expected an object",
                        m_opts.feed_url, feed.type_name());
    throw RelayError(ErrorKind::MalformedUpstreamData, "match feed root is not a JSON object");
  }

  auto snap = std::make_shared<const Snapshot>(build_snapshot(feed, started));
  log::INFO<Catalog>(LogMode::Async, "Catalog refreshed: {} matches, {} live", snap->total(),
                     snap->live_count);
  return snap;
}

auto MatchCatalog::install(SnapshotPtr fresh) -> SnapshotPtr
{
  std::unique_lock lock(m_mutex);
  if (!m_snapshot || m_snapshot->fetched_at <= fresh->fetched_at)
    m_snapshot = std::move(fresh);
  return m_snapshot;
}

void MatchCatalog::async_find_match(asio::any_io_executor ex, MatchID match_id,
                                    MatchHandler handler)
{
  async_snapshot(ex,
                 [match_id = std::move(match_id), handler = std::move(handler)](
                   std::exception_ptr err, SnapshotPtr snap)
                 {
                   Match found;
                   if (!err)
                   {
                     try
                     {
                       found = lookup(*snap, match_id);
                     }
                     catch (const RelayError&)
                     {
                       err = std::current_exception();
                     }
                   }
                   handler(err, std::move(found));
                 });
}

void MatchCatalog::async_get_stream_url(asio::any_io_executor ex, MatchID match_id,
                                        CdnVariant variant, StreamUrlHandler handler)
{
  async_snapshot(ex,
                 [match_id = std::move(match_id), variant, handler = std::move(handler)](
                   std::exception_ptr err, SnapshotPtr snap)
                 {
                   AbsURL url;
                   if (!err)
                   {
                     try
                     {
                       const auto& streams = lookup(*snap, match_id).streams;
                       if (!streams.get(variant))
                       {
                         log::DBG<Catalog>(LogMode::Async, "Match {} carries no {} stream",
                                           match_id, to_string(variant));
                         throw RelayError(ErrorKind::NotFound, "Invalid or missing stream URL");
                       }
                       url = *streams.get(variant);
                     }
                     catch (const RelayError&)
                     {
                       err = std::current_exception();
                     }
                   }
                   handler(err, std::move(url));
                 });
}

} // namespace libfanrelay::catalog

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

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>

#include <libfanrelay/catalog/match.hpp>
#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/network/fetcher.hpp>

/*
 * @MatchCatalog
 *
 * TTL cache over the upstream match feed.
 *
 *   async_snapshot() --(now - fetched_at >= ttl)--> async_fetch_all(feed) -> build_snapshot -> swap
 *          |
 *          +--(fresh)--> current snapshot, posted to the caller's executor
 *
 * Snapshots are immutable and handed out as shared_ptr<const Snapshot>, so readers keep
 * whatever they were given while a refresh installs the next one. No lock is held while the
 * feed is in flight.
 *
 * Concurrent refreshes are NOT coalesced: every request that sees a stale snapshot fetches the
 * feed itself. The newest snapshot wins when they race.
 *
 * Errors reach the handler as RelayError(UpstreamError | MalformedUpstreamData | NotFound).
 *
 */

namespace libfanrelay::catalog
{

namespace asio = boost::asio;

struct CatalogOptions
{
  AbsURL       feed_url = macros::to_string(macros::DEFAULT_FEED_URL);
  Seconds      ttl{FANRELAY_CATALOG_TTL_SECS};
  Milliseconds fetch_timeout{Seconds(FANRELAY_CATALOG_TIMEOUT_SECS)};
  UserAgent    user_agent = macros::to_string(macros::DEFAULT_USER_AGENT);
};

class FANRELAY_API MatchCatalog
{
public:
  using Clock            = std::function<TimePoint()>;
  using SnapshotPtr      = std::shared_ptr<const Snapshot>;
  using SnapshotHandler  = std::function<void(std::exception_ptr, SnapshotPtr)>;
  using MatchHandler     = std::function<void(std::exception_ptr, Match)>;
  using StreamUrlHandler = std::function<void(std::exception_ptr, AbsURL)>;

  MatchCatalog(network::IUpstreamFetcher& fetcher, CatalogOptions opts,
               Clock clock = &SteadyClock::now);

  void async_snapshot(asio::any_io_executor ex, SnapshotHandler handler);

  // NotFound for an unknown id
  void async_find_match(asio::any_io_executor ex, MatchID match_id, MatchHandler handler);

  // NotFound for an unknown id or a variant the match does not carry
  void async_get_stream_url(asio::any_io_executor ex, MatchID match_id, CdnVariant variant,
                            StreamUrlHandler handler);

  // Never fetches, nullptr before the first successful refresh
  [[nodiscard]] auto cached() const -> SnapshotPtr;
  [[nodiscard]] auto is_stale() const -> bool;
  [[nodiscard]] auto fetch_count() const noexcept -> ui64 { return m_fetches.load(); }
  [[nodiscard]] auto options() const noexcept -> const CatalogOptions& { return m_opts; }

private:
  network::IUpstreamFetcher& m_fetcher;
  CatalogOptions             m_opts;
  Clock                      m_clock;

  mutable std::shared_mutex m_mutex;
  SnapshotPtr               m_snapshot;
  std::atomic<ui64>         m_fetches{0};

  auto parse_feed(const network::FetchResult& res, TimePoint started) const -> SnapshotPtr;
  auto install(SnapshotPtr fresh) -> SnapshotPtr;
  [[nodiscard]] auto stale_at(const Snapshot& snap, TimePoint now) const -> bool;
};

} // namespace libfanrelay::catalog

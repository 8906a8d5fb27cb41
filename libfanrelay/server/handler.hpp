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

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include <libfanrelay/catalog/catalog.hpp>
#include <libfanrelay/common/error.hpp>
#include <libfanrelay/relay/playlist-relay.hpp>
#include <libfanrelay/relay/segment-proxy.hpp>
#include <libfanrelay/relay/session-store.hpp>
#include <libfanrelay/server/metrics.hpp>

/*
 * @ApiHandler
 *
 * Maps one parsed request to one Reply. Nothing here touches the client socket.
 *
 * Routes that need the origin (catalog refresh, playlists, segments) complete asynchronously on
 * the executor passed to async_handle(), the rest are posted to it right away. The handler is
 * invoked exactly once and never from inside async_handle() itself.
 *
 *   GET     /matches                     catalog snapshot
 *   GET     /matches/{id}                one match
 *   GET     /relay/{id}?cdn={variant}    rewritten master playlist
 *   GET     /relay/{id}/{path...}        segment (Reply::stream is set, body comes later)
 *   GET     /health, /metrics
 *   GET     anything else                static file from the public directory
 *   OPTIONS *                            204 CORS preflight
 *
 * RelayError is turned into {"error": "..."} here:
 *
 *   NotFound, SessionNotFound, InvalidStream        404
 *   InvalidRequest                                  400
 *   UpstreamUnavailable                             404 for playlists, origin status for segments
 *   UpstreamError, MalformedUpstreamData, others    500
 *
 */

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;

namespace libfanrelay::server
{

using Request  = http::request<http::string_body>;
using Response = http::response<http::string_body>;

struct Reply
{
  // Full response, or only the head when `stream` is set
  Response                            message;
  std::optional<relay::SegmentStream> stream;

  [[nodiscard]] auto is_streamed() const -> bool { return stream.has_value(); }
};

using ReplyHandler = std::function<void(Reply)>;
using RequestPtr   = std::shared_ptr<const Request>;

struct HandlerContext
{
  catalog::MatchCatalog&    catalog;
  relay::RelaySessionStore& sessions;
  relay::PlaylistRelay&     playlists;
  relay::SegmentProxy&      segments;
  Metrics&                  metrics;
  Directory                 public_dir;
};

enum class Route
{
  Catalog,
  Match,
  Playlist,
  Segment,
  Health,
  Metrics,
  Static,
};

class FANRELAY_API ApiHandler
{
public:
  explicit ApiHandler(HandlerContext ctx) : m_ctx(std::move(ctx)) {}

  // Never fails for request-level problems, those become error replies
  void async_handle(asio::any_io_executor ex, Request req, ReplyHandler handler);

  static auto status_for(const RelayError& err, Route route) -> HttpStatus;

private:
  HandlerContext m_ctx;

  void handle_matches(const asio::any_io_executor& ex, const RequestPtr& req,
                      const ReplyHandler& handler);
  void handle_match(const asio::any_io_executor& ex, const RequestPtr& req,
                    std::string_view match_id, const ReplyHandler& handler);
  void handle_playlist(const asio::any_io_executor& ex, const RequestPtr& req,
                       std::string_view match_id, std::string_view query,
                       const ReplyHandler& handler);
  void handle_segment(const asio::any_io_executor& ex, const RequestPtr& req,
                      std::string_view match_id, std::string_view rel_path,
                      const ReplyHandler& handler);
  auto handle_health(const Request& req) -> Reply;
  auto handle_metrics(const Request& req) -> Reply;
  auto handle_static(const Request& req, std::string_view path) -> Reply;

  void route(const asio::any_io_executor& ex, const RequestPtr& req, const ReplyHandler& handler);
};

// Value of `key` in a raw query string ("a=1&cdn=x"), percent-decoded
FANRELAY_API auto query_param(std::string_view query, std::string_view key)
  -> std::optional<std::string>;

FANRELAY_API auto json_error(const Request& req, HttpStatus status, std::string_view message)
  -> Response;

} // namespace libfanrelay::server

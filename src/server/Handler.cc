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

#include <algorithm>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/common/network/routes.h>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/network/url.hpp>
#include <libfanrelay/server/handler.hpp>
#include <libfanrelay/server/health.hpp>
#include <libfanrelay/server/static.hpp>

using Server = libfanrelay::log::SERVER;

namespace libfanrelay::server
{

namespace
{

using json = nlohmann::ordered_json;

auto to_sv(beast::string_view s) -> std::string_view { return {s.data(), s.size()}; }
auto to_bsv(std::string_view s) -> beast::string_view { return {s.data(), s.size()}; }

auto dump(const json& doc) -> std::string
{
  return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto base_response(const Request& req, HttpStatus status) -> Response
{
  Response res;
  res.version(req.version());
  res.result(status);
  res.set(http::field::server, to_bsv(macros::SERVER_NAME));
  res.set(http::field::access_control_allow_origin, to_bsv(macros::CORS_ALLOW_ALL));
  res.keep_alive(req.keep_alive());
  return res;
}

auto text_response(const Request& req, HttpStatus status, std::string_view content_type,
                   std::string body) -> Response
{
  Response res = base_response(req, status);
  res.set(http::field::content_type, to_bsv(content_type));
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

auto reply_of(Response res) -> Reply
{
  Reply out;
  out.message = std::move(res);
  return out;
}

auto is_upstream_failure(const RelayError& err) -> bool
{
  return err.kind() == ErrorKind::UpstreamUnavailable || err.kind() == ErrorKind::UpstreamError ||
         err.kind() == ErrorKind::MalformedUpstreamData;
}

void reply_later(const asio::any_io_executor& ex, const ReplyHandler& handler, Reply reply)
{
  asio::post(ex, [handler, reply = std::move(reply)]() mutable { handler(std::move(reply)); });
}

// RelayErrors go to `on_relay`, any other std::exception becomes a plain 500
template <typename OnRelay>
auto reply_for(const Request& req, const std::exception_ptr& err, OnRelay&& on_relay) -> Reply
{
  try
  {
    std::rethrow_exception(err);
  }
  catch (const RelayError& e)
  {
    return on_relay(e);
  }
  catch (const std::exception& e)
  {
    log::ERROR<Server>(LogMode::Async, "Unhandled error for {} {}: {}",
                       to_sv(req.method_string()), to_sv(req.target()), e.what());
    return reply_of(json_error(req, 500, e.what()));
  }
}

} // namespace

auto query_param(std::string_view query, std::string_view key) -> std::optional<std::string>
{
  if (query.starts_with('?'))
    query.remove_prefix(1);

  while (!query.empty())
  {
    const auto       amp  = query.find('&');
    std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

    const auto       eq   = pair.find('=');
    std::string_view name = pair.substr(0, eq);
    if (name != key)
      continue;

    std::string value(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
    std::ranges::replace(value, '+', ' ');
    return network::percent_decode(value);
  }

  return std::nullopt;
}

auto json_error(const Request& req, HttpStatus status, std::string_view message) -> Response
{
  const json body = {{"error", std::string(message)}};
  return text_response(req, status, macros::CONTENT_TYPE_JSON, dump(body));
}

auto ApiHandler::status_for(const RelayError& err, Route route) -> HttpStatus
{
  switch (err.kind())
  {
    case ErrorKind::NotFound:
    case ErrorKind::SessionNotFound:
    case ErrorKind::InvalidStream:
      return 404;
    case ErrorKind::InvalidRequest:
      return 400;
    case ErrorKind::UpstreamUnavailable:
      if (route == Route::Segment)
      {
        // Redirects are not followed, so a 3xx is as much a failure as a 4xx
        if (const auto origin = err.upstream_status(); origin && *origin >= 300 && *origin <= 599)
          return *origin;
        return 502;
      }
      return 404;
    case ErrorKind::UpstreamError:
    case ErrorKind::MalformedUpstreamData:
      return 500;
  }
  return 500;
}

void ApiHandler::async_handle(asio::any_io_executor ex, Request req, ReplyHandler handler)
{
  const auto request = std::make_shared<const Request>(std::move(req));
  try
  {
    route(ex, request, handler);
  }
  catch (const std::exception& e)
  {
    log::ERROR<Server>(LogMode::Async, "Unhandled error for {} {}: {}",
                       to_sv(request->method_string()), to_sv(request->target()), e.what());
    reply_later(ex, handler, reply_of(json_error(*request, 500, e.what())));
  }
}

void ApiHandler::route(const asio::any_io_executor& ex, const RequestPtr& req,
                       const ReplyHandler& handler)
{
  const std::string_view target = to_sv(req->target());

  if (req->method() == http::verb::options)
  {
    Response res = base_response(*req, 204);
    res.set(http::field::access_control_allow_methods, to_bsv(macros::CORS_ALLOW_METHODS));
    const auto wanted = (*req)[http::field::access_control_request_headers];
    res.set(http::field::access_control_allow_headers, wanted.empty() ? "*" : wanted);
    res.set(http::field::access_control_max_age, "86400");
    res.prepare_payload();
    reply_later(ex, handler, reply_of(std::move(res)));
    return;
  }

  if (req->method() != http::verb::get)
  {
    log::WARN<Server>(LogMode::Async, "{} {} is not allowed", to_sv(req->method_string()),
                      target);
    Response res = json_error(*req, 405, "Method not allowed");
    res.set(http::field::allow, to_bsv(macros::CORS_ALLOW_METHODS));
    reply_later(ex, handler, reply_of(std::move(res)));
    return;
  }

  const auto [path, query] = network::split_query(target);

  if (path == routes::SERVER_PATH_MATCHES)
  {
    handle_matches(ex, req, handler);
    return;
  }

  if (path.starts_with(routes::SERVER_PATH_MATCH_ITEM))
  {
    const auto match_id =
      network::percent_decode(path.substr(routes::SERVER_PATH_MATCH_ITEM.size()));
    handle_match(ex, req, match_id, handler);
    return;
  }

  if (path.starts_with(routes::SERVER_PATH_RELAY))
  {
    const std::string_view rest_path = path.substr(routes::SERVER_PATH_RELAY.size());
    const auto             slash     = rest_path.find('/');
    const std::string      match_id  = network::percent_decode(rest_path.substr(0, slash));

    if (slash == std::string_view::npos)
    {
      handle_playlist(ex, req, match_id, query, handler);
      return;
    }

    // The segment path goes to the origin as it came, query string included
    const auto rel_path = target.substr(routes::SERVER_PATH_RELAY.size() + slash + 1);
    handle_segment(ex, req, match_id, rel_path, handler);
    return;
  }

  if (path == routes::SERVER_PATH_HEALTH)
  {
    reply_later(ex, handler, handle_health(*req));
    return;
  }

  if (path == routes::SERVER_PATH_METRICS)
  {
    reply_later(ex, handler, handle_metrics(*req));
    return;
  }

  reply_later(ex, handler, handle_static(*req, network::percent_decode(path)));
}

void ApiHandler::handle_matches(const asio::any_io_executor& ex, const RequestPtr& req,
                                const ReplyHandler& handler)
{
  ++m_ctx.metrics.catalog_requests;
  m_ctx.catalog.async_snapshot(
    ex,
    [this, req, handler](std::exception_ptr err, catalog::MatchCatalog::SnapshotPtr snap)
    {
      if (!err)
      {
        handler(reply_of(
          text_response(*req, 200, macros::CONTENT_TYPE_JSON, dump(snap->document))));
        return;
      }

      handler(reply_for(*req, err,
                        [&](const RelayError& e)
                        {
                          ++m_ctx.metrics.upstream_failures;
                          log::ERROR<Server>(LogMode::Async, "API Error: {}", e.what());
                          return reply_of(
                            json_error(*req, status_for(e, Route::Catalog),
                                       std::string("Failed to fetch matches: ") + e.what()));
                        }));
    });
}

void ApiHandler::handle_match(const asio::any_io_executor& ex, const RequestPtr& req,
                              std::string_view match_id, const ReplyHandler& handler)
{
  ++m_ctx.metrics.catalog_requests;
  m_ctx.catalog.async_find_match(
    ex, MatchID(match_id),
    [this, req, handler, id = std::string(match_id)](std::exception_ptr err, catalog::Match match)
    {
      if (!err)
      {
        handler(reply_of(
          text_response(*req, 200, macros::CONTENT_TYPE_JSON, dump(match.document))));
        return;
      }

      handler(reply_for(*req, err,
                        [&](const RelayError& e)
                        {
                          const HttpStatus status = status_for(e, Route::Match);
                          if (status == 404)
                            return reply_of(json_error(*req, status, e.what()));

                          ++m_ctx.metrics.upstream_failures;
                          log::ERROR<Server>(LogMode::Async, "Match Fetch Error for {}: {}", id,
                                             e.what());
                          return reply_of(json_error(
                            *req, status, std::string("Failed to fetch match: ") + e.what()));
                        }));
    });
}

void ApiHandler::handle_playlist(const asio::any_io_executor& ex, const RequestPtr& req,
                                 std::string_view match_id, std::string_view query,
                                 const ReplyHandler& handler)
{
  ++m_ctx.metrics.playlist_requests;

  const auto        cdn     = query_param(query, routes::SERVER_QUERY_CDN);
  const std::string variant = cdn && !cdn->empty()
                                ? *cdn
                                : macros::to_string(macros::DEFAULT_CDN_VARIANT);

  m_ctx.playlists.async_get_master_playlist(
    ex, MatchID(match_id), variant,
    [this, req, handler](std::exception_ptr err, relay::RewrittenPlaylist playlist)
    {
      if (!err)
      {
        Response res =
          text_response(*req, 200, playlist.content_type, std::move(playlist.body));
        res.set(http::field::cache_control, "no-cache");
        handler(reply_of(std::move(res)));
        return;
      }

      handler(reply_for(*req, err,
                        [&](const RelayError& e)
                        {
                          if (is_upstream_failure(e))
                            ++m_ctx.metrics.upstream_failures;

                          const HttpStatus status = status_for(e, Route::Playlist);
                          if (status == 500)
                            return reply_of(json_error(
                              *req, status, std::string("Failed to fetch stream: ") + e.what()));
                          return reply_of(json_error(*req, status, e.what()));
                        }));
    });
}

void ApiHandler::handle_segment(const asio::any_io_executor& ex, const RequestPtr& req,
                                std::string_view match_id, std::string_view rel_path,
                                const ReplyHandler& handler)
{
  ++m_ctx.metrics.segment_requests;
  m_ctx.segments.async_open_segment(
    ex, match_id, rel_path,
    [this, req, handler](std::exception_ptr err, relay::SegmentStream stream)
    {
      if (!err)
      {
        Reply out;
        out.message = base_response(*req, 200);
        out.message.set(http::field::content_type, to_bsv(stream.content_type));
        if (stream.content_length)
          out.message.content_length(*stream.content_length);
        else if (req->version() >= 11)
          out.message.chunked(true);
        else
          out.message.keep_alive(false); // HTTP/1.0 without a length: the close ends the body

        out.stream = std::move(stream);
        handler(std::move(out));
        return;
      }

      handler(reply_for(*req, err,
                        [&](const RelayError& e)
                        {
                          if (is_upstream_failure(e))
                            ++m_ctx.metrics.upstream_failures;

                          const HttpStatus status = status_for(e, Route::Segment);
                          if (status == 500)
                            return reply_of(json_error(
                              *req, status, std::string("Failed to fetch segment: ") + e.what()));
                          return reply_of(json_error(*req, status, e.what()));
                        }));
    });
}

auto ApiHandler::handle_health(const Request& req) -> Reply
{
  const auto health = HealthChecker::check(m_ctx.public_dir, m_ctx.catalog, m_ctx.sessions);

  json doc;
  doc["status"]         = health.status_message;
  doc["healthy"]        = health.is_healthy;
  doc["uptime_seconds"] = m_ctx.metrics.get_uptime().count();
  doc["checks"]         = json::object();
  for (const auto& [name, result] : health.checks)
    doc["checks"][name] = result;

  return reply_of(
    text_response(req, health.is_healthy ? 200 : 503, macros::CONTENT_TYPE_JSON, dump(doc)));
}

auto ApiHandler::handle_metrics(const Request& req) -> Reply
{
  MetricsGauges gauges;
  gauges.catalog_fetches = m_ctx.catalog.fetch_count();
  gauges.relay_sessions  = m_ctx.sessions.size();
  if (const auto snap = m_ctx.catalog.cached())
    gauges.catalog_matches = snap->total();

  return reply_of(text_response(req, 200, macros::CONTENT_TYPE_PROMETHEUS,
                                MetricsSerializer::to_prometheus_format(m_ctx.metrics, gauges)));
}

auto ApiHandler::handle_static(const Request& req, std::string_view path) -> Reply
{
  ++m_ctx.metrics.static_requests;
  try
  {
    auto file = load_static_file(m_ctx.public_dir, path);
    return reply_of(text_response(req, 200, file.content_type, std::move(file.body)));
  }
  catch (const RelayError& e)
  {
    return reply_of(json_error(req, status_for(e, Route::Static), e.what()));
  }
}

} // namespace libfanrelay::server

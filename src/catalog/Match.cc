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
#include <cmath>
#include <limits>

#include <libfanrelay/catalog/match.hpp>
#include <libfanrelay/log-macros.hpp>

using Catalog = libfanrelay::log::CATALOG;

namespace libfanrelay::catalog
{

namespace
{

constexpr std::string_view STREAMING_CDN_KEY = "STREAMING_CDN";

// Feed values that a JS-style `x || fallback` would replace
auto is_falsy(const json& v) -> bool
{
  if (v.is_null())
    return true;
  if (v.is_boolean())
    return !v.get<bool>();
  if (v.is_string())
    return v.get_ref<const std::string&>().empty();
  if (v.is_number())
    return v.get<double>() == 0.0;
  return false;
}

auto member_or_null(const json& obj, std::string_view key) -> json
{
  if (!obj.is_object())
    return nullptr;
  const auto it = obj.find(std::string(key));
  return it == obj.end() ? json(nullptr) : *it;
}

} // namespace

auto to_string(CdnVariant variant) -> std::string_view
{
  switch (variant)
  {
    case CdnVariant::AdFree:
      return "adfree_stream";
    case CdnVariant::Dai:
      return "dai_stream";
    case CdnVariant::PrimaryPlayback:
      return "Primary_Playback_URL";
    case CdnVariant::Fancode:
      return "fancode_cdn";
    case CdnVariant::DaiGoogle:
      return "dai_google_cdn";
    case CdnVariant::Cloudfront:
      return "cloudfront_cdn";
    case CdnVariant::Sony:
      return "sony_cdn";
    case CdnVariant::Hindi:
      return "hindi_stream";
  }
  return "unknown";
}

auto parse_cdn_variant(std::string_view name) -> std::optional<CdnVariant>
{
  for (const auto variant : ALL_CDN_VARIANTS)
    if (to_string(variant) == name)
      return variant;
  return std::nullopt;
}

auto is_top_level(CdnVariant variant) -> bool
{
  return variant == CdnVariant::AdFree || variant == CdnVariant::Dai;
}

auto StreamSet::available() const -> std::size_t
{
  return static_cast<std::size_t>(
    std::ranges::count_if(m_urls, [](const auto& url) { return url.has_value(); }));
}

auto match_id_text(const json& value) -> MatchID
{
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number_unsigned())
    return std::to_string(value.get<ui64>());
  if (value.is_number_integer())
    return std::to_string(value.get<i64>());
  if (value.is_number_float())
  {
    // -2^63 and 2^63 are both exact doubles, anything outside [lowest, bound) does not fit an i64
    constexpr double I64_LOWEST = static_cast<double>(std::numeric_limits<i64>::min());
    constexpr double I64_BOUND  = -I64_LOWEST;

    const double d = value.get<double>();
    // 7.0 and "7" name the same match
    if (std::isfinite(d) && std::trunc(d) == d && d >= I64_LOWEST && d < I64_BOUND)
      return std::to_string(static_cast<i64>(d));
    return value.dump();
  }
  return {};
}

auto normalize_match(const json& entry) -> std::optional<Match>
{
  if (!entry.is_object())
    return std::nullopt;

  Match m;
  m.id = match_id_text(member_or_null(entry, "match_id"));

  if (const auto status = member_or_null(entry, "status"); status.is_string())
    m.status = status.get<std::string>();

  if (const auto category = member_or_null(entry, "category"); !category.is_null())
    m.category = category.is_string() ? category.get<std::string>() : category.dump();

  const json cdn     = member_or_null(entry, STREAMING_CDN_KEY);
  json       streams = json::object();

  for (const auto variant : ALL_CDN_VARIANTS)
  {
    const std::string_view name = to_string(variant);
    json                   raw  = member_or_null(is_top_level(variant) ? entry : cdn, name);

    if (raw.is_string() && !raw.get_ref<const std::string&>().empty())
      m.streams.set(variant, raw.get<std::string>());

    streams[std::string(name)] = std::move(raw);
  }

  m.document = entry;
  if (const auto teams = member_or_null(entry, "teams"); is_falsy(teams))
    m.document["teams"] = json::array();
  m.document["streams"] = std::move(streams);

  return m;
}

auto Snapshot::find(std::string_view id) const -> const Match*
{
  if (id.empty())
    return nullptr;

  const auto it = std::ranges::find_if(matches, [id](const Match& m) { return m.id == id; });
  return it == matches.end() ? nullptr : &*it;
}

auto build_snapshot(const json& feed, TimePoint fetched_at) -> Snapshot
{
  Snapshot snap;
  snap.fetched_at = fetched_at;

  json normalized = json::array();
  json categories = json::array();

  if (const auto entries = member_or_null(feed, "matches"); entries.is_array())
  {
    for (const auto& entry : entries)
    {
      auto match = normalize_match(entry);
      if (!match)
      {
        log::WARN<Catalog>("Skipping non-object entry in matches: {}", entry.dump());
        continue;
      }

      if (match->is_live())
        ++snap.live_count;
      else if (match->is_upcoming())
        ++snap.upcoming_count;

      if (std::ranges::find(snap.categories, match->category) == snap.categories.end())
      {
        snap.categories.push_back(match->category);
        categories.push_back(match->category ? json(*match->category) : json(nullptr));
      }

      normalized.push_back(match->document);
      snap.matches.push_back(std::move(*match));
    }
  }

  snap.document                     = feed;
  snap.document["matches"]          = std::move(normalized);
  snap.document["categories"]       = std::move(categories);
  snap.document["live_matches"]     = snap.live_count;
  snap.document["upcoming_matches"] = snap.upcoming_count;
  snap.document["total_matches"]    = snap.total();

  log::DBG<Catalog>("Snapshot built: {} matches ({} live, {} upcoming), {} categories",
                    snap.total(), snap.live_count, snap.upcoming_count, snap.categories.size());
  return snap;
}

} // namespace libfanrelay::catalog

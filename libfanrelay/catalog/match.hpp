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

#include <array>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/types.hpp>

/*
 * @MATCH MODEL
 *
 * One feed entry looks roughly like this (only the fields the relay reads are shown):
 *
 *   {
 *     "match_id": 12345,                 // number or string, compared by its text
 *     "status": "LIVE",                  // LIVE | NOT_STARTED | anything else
 *     "category": "Cricket",
 *     "teams": [ ... ],                  // passed through, [] when absent
 *     "adfree_stream": "https://...m3u8",
 *     "dai_stream": "https://...m3u8",
 *     "STREAMING_CDN": {
 *       "Primary_Playback_URL": "...", "fancode_cdn": "...", "dai_google_cdn": "...",
 *       "cloudfront_cdn": "...", "sony_cdn": "...", "hindi_stream": "..."
 *     }
 *   }
 *
 * Normalizing keeps the whole original object (unknown fields reach API clients untouched) and
 * adds "teams" and a flat "streams" object with one key per CdnVariant.
 *
 */

namespace libfanrelay::catalog
{

using json = nlohmann::ordered_json; // keeps the feed's key order

enum class CdnVariant : ui8
{
  AdFree,
  Dai,
  PrimaryPlayback,
  Fancode,
  DaiGoogle,
  Cloudfront,
  Sony,
  Hindi,
};

inline constexpr std::size_t CDN_VARIANT_COUNT = 8;

inline constexpr std::array<CdnVariant, CDN_VARIANT_COUNT> ALL_CDN_VARIANTS = {
  CdnVariant::AdFree,    CdnVariant::Dai,        CdnVariant::PrimaryPlayback, CdnVariant::Fancode,
  CdnVariant::DaiGoogle, CdnVariant::Cloudfront, CdnVariant::Sony,            CdnVariant::Hindi,
};

// Wire name, as used both in the feed and in ?cdn=
FANRELAY_API auto to_string(CdnVariant variant) -> std::string_view;

FANRELAY_API auto parse_cdn_variant(std::string_view name) -> std::optional<CdnVariant>;

// Top-level variants live on the match itself, the rest under STREAMING_CDN
FANRELAY_API auto is_top_level(CdnVariant variant) -> bool;

class StreamSet
{
public:
  [[nodiscard]] auto get(CdnVariant variant) const -> const std::optional<AbsURL>&
  {
    return m_urls[static_cast<std::size_t>(variant)];
  }

  void set(CdnVariant variant, AbsURL url)
  {
    m_urls[static_cast<std::size_t>(variant)] = std::move(url);
  }

  [[nodiscard]] auto available() const -> std::size_t;

private:
  std::array<std::optional<AbsURL>, CDN_VARIANT_COUNT> m_urls;
};

struct Match
{
  MatchID                     id; // empty when the feed entry has no usable match_id
  std::string                 status;
  std::optional<CategoryName> category;
  StreamSet                   streams;
  json                        document; // serialized form served to API clients

  [[nodiscard]] auto is_live() const -> bool { return status == "LIVE"; }
  [[nodiscard]] auto is_upcoming() const -> bool { return status == "NOT_STARTED"; }
};

// Textual form of a match id: strings as-is, integers in decimal, anything else empty
FANRELAY_API auto match_id_text(const json& value) -> MatchID;

// Non-object entries yield std::nullopt
FANRELAY_API auto normalize_match(const json& entry) -> std::optional<Match>;

struct Snapshot
{
  std::vector<Match>                       matches;
  std::vector<std::optional<CategoryName>> categories; // distinct, first appearance order
  std::size_t                              live_count     = 0;
  std::size_t                              upcoming_count = 0;
  TimePoint                                fetched_at;
  json                                     document;

  [[nodiscard]] auto total() const -> std::size_t { return matches.size(); }
  [[nodiscard]] auto find(std::string_view id) const -> const Match*;
};

// `feed` must be a JSON object, a missing or non-array "matches" gives an empty snapshot
FANRELAY_API auto build_snapshot(const json& feed, TimePoint fetched_at) -> Snapshot;

} // namespace libfanrelay::catalog

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

#include <gtest/gtest.h>

#include <libfanrelay/catalog/match.hpp>

using namespace libfanrelay;
using namespace libfanrelay::catalog;

TEST(CdnVariant, WireNamesRoundTrip)
{
  for (const auto variant : ALL_CDN_VARIANTS)
  {
    const auto parsed = parse_cdn_variant(to_string(variant));
    ASSERT_TRUE(parsed.has_value()) << to_string(variant);
    EXPECT_EQ(*parsed, variant);
  }
  EXPECT_FALSE(parse_cdn_variant("ADFREE_STREAM").has_value());
  EXPECT_FALSE(parse_cdn_variant("").has_value());
}

TEST(MatchIdText, NormalizesNumbersAndStrings)
{
  EXPECT_EQ(match_id_text(json(12345)), "12345");
  EXPECT_EQ(match_id_text(json(-3)), "-3");
  EXPECT_EQ(match_id_text(json(7.0)), "7");
  EXPECT_EQ(match_id_text(json("abc-1")), "abc-1");
  EXPECT_EQ(match_id_text(json(nullptr)), "");
  EXPECT_EQ(match_id_text(json::array()), "");
}

TEST(MatchIdText, WholeDoublesOutsideI64KeepTheirJsonForm)
{
  EXPECT_EQ(match_id_text(json(1e20)), json(1e20).dump());

  const json past_u64 = json::parse("18446744073709551616");
  ASSERT_TRUE(past_u64.is_number_float());
  EXPECT_EQ(match_id_text(past_u64), past_u64.dump());

  EXPECT_EQ(match_id_text(json(9223372036854775808.0)), json(9223372036854775808.0).dump());
  EXPECT_EQ(match_id_text(json(-9223372036854775808.0)), "-9223372036854775808");
  EXPECT_EQ(match_id_text(json(-1e19)), json(-1e19).dump());
}

TEST(NormalizeMatch, CollectsTopLevelAndCdnVariants)
{
  const json entry = json::parse(R"({
    "match_id": 10,
    "status": "LIVE",
    "category": "Cricket",
    "title": "A vs B",
    "adfree_stream": "https://cdn.example/a/master.m3u8",
    "dai_stream": "",
    "STREAMING_CDN": {
      "sony_cdn": "https://sony.example/s/master.m3u8",
      "fancode_cdn": null
    }
  })");

  const auto match = normalize_match(entry);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->id, "10");
  EXPECT_TRUE(match->is_live());
  EXPECT_EQ(match->category, "Cricket");
  EXPECT_EQ(match->streams.get(CdnVariant::AdFree), "https://cdn.example/a/master.m3u8");
  EXPECT_EQ(match->streams.get(CdnVariant::Sony), "https://sony.example/s/master.m3u8");
  EXPECT_FALSE(match->streams.get(CdnVariant::Dai).has_value());
  EXPECT_FALSE(match->streams.get(CdnVariant::Fancode).has_value());
  EXPECT_EQ(match->streams.available(), 2u);

  const auto& doc = match->document;
  EXPECT_EQ(doc["title"], "A vs B");
  EXPECT_EQ(doc["teams"], json::array());
  ASSERT_TRUE(doc["streams"].is_object());
  EXPECT_EQ(doc["streams"].size(), CDN_VARIANT_COUNT);
  EXPECT_EQ(doc["streams"]["adfree_stream"], "https://cdn.example/a/master.m3u8");
  EXPECT_TRUE(doc["streams"]["hindi_stream"].is_null());
}

TEST(NormalizeMatch, KeepsTruthyTeams)
{
  const json entry = json::parse(R"({"match_id": "x", "teams": [{"name": "A"}]})");
  const auto match = normalize_match(entry);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->document["teams"].size(), 1u);
  EXPECT_FALSE(match->category.has_value());
}

TEST(NormalizeMatch, RejectsNonObjects)
{
  EXPECT_FALSE(normalize_match(json(5)).has_value());
  EXPECT_FALSE(normalize_match(json("LIVE")).has_value());
}

TEST(BuildSnapshot, CountsAndCategories)
{
  const json feed = json::parse(R"({
    "source": "feed",
    "matches": [
      {"match_id": 1, "status": "LIVE", "category": "Cricket"},
      {"match_id": 2, "status": "NOT_STARTED", "category": "Football"},
      {"match_id": 3, "status": "COMPLETED", "category": "Cricket"},
      {"match_id": 4, "status": "LIVE"},
      "garbage"
    ]
  })");

  const auto snap = build_snapshot(feed, TimePoint{});
  EXPECT_EQ(snap.total(), 4u);
  EXPECT_EQ(snap.live_count, 2u);
  EXPECT_EQ(snap.upcoming_count, 1u);
  ASSERT_EQ(snap.categories.size(), 3u);
  EXPECT_EQ(snap.categories[0], "Cricket");
  EXPECT_EQ(snap.categories[1], "Football");
  EXPECT_FALSE(snap.categories[2].has_value());

  EXPECT_EQ(snap.document["source"], "feed");
  EXPECT_EQ(snap.document["total_matches"], 4);
  EXPECT_EQ(snap.document["live_matches"], 2);
  EXPECT_EQ(snap.document["upcoming_matches"], 1);
  EXPECT_EQ(snap.document["categories"].size(), 3u);
  EXPECT_TRUE(snap.document["categories"][2].is_null());

  ASSERT_NE(snap.find("3"), nullptr);
  EXPECT_EQ(snap.find("3")->status, "COMPLETED");
  EXPECT_EQ(snap.find("99"), nullptr);
  EXPECT_EQ(snap.find(""), nullptr);
}

TEST(BuildSnapshot, MissingMatchesGivesEmptySnapshot)
{
  const auto snap = build_snapshot(json::object(), TimePoint{});
  EXPECT_EQ(snap.total(), 0u);
  EXPECT_EQ(snap.document["total_matches"], 0);
  EXPECT_TRUE(snap.document["matches"].is_array());
}

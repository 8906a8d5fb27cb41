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

#include <string_view>

#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/types.hpp>

/*
 * @PLAYLIST REWRITER
 *
 * Points every child playlist and segment reference of an .m3u8 at the relay:
 *
 *   #EXTM3U                                #EXTM3U
 *   #EXT-X-MEDIA:...,URI="a/audio.m3u8"    #EXT-X-MEDIA:...,URI="/relay/7/a/audio.m3u8"
 *   chunk1.ts                         ->   /relay/7/chunk1.ts
 *   low/index.m3u8?t=9                     /relay/7/low/index.m3u8?t=9
 *
 * Only references whose path (query excluded) ends in .m3u8 or .ts are touched. fMP4 media
 * (.m4s, .mp4), keys, init maps and byte ranges go out unchanged.
 *
 * Line terminators are kept as they came (\n or \r\n) and so is the presence of a final newline.
 *
 */

namespace libfanrelay::hls
{

FANRELAY_API auto is_relayable_uri(std::string_view uri) -> bool;

// "/relay/{match_id}/{uri}", the match id percent-encoded as a single path segment
FANRELAY_API auto relay_path(std::string_view match_id, std::string_view uri) -> std::string;

FANRELAY_API auto rewrite_playlist(std::string_view playlist, std::string_view match_id)
  -> PlaylistData;

} // namespace libfanrelay::hls

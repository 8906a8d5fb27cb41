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

// Contains typedefs for the entire project

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

//[ Int types ]//
using i32  = std::int32_t;
using i64  = std::int64_t;
using uint = unsigned int;
using ui8  = std::uint8_t;
using ui16 = std::uint16_t;
using ui64 = std::uint64_t;

//[ NETWORKING DEFS ]//
using IPAddr      = std::string; // Bind address of the relay
using PortNo      = ui16;        // Port number of the relay (or of an origin)
using NetTarget   = std::string; // Request target, path + query ("/relay/1/a.ts?x=1")
using NetResponse = std::string; // Buffered response body
using HttpStatus  = unsigned;    // Raw numeric status as sent by an origin
using ContentType = std::string;
using UserAgent   = std::string;

//[ URL DEFS ]//
using AbsURL  = std::string; // Absolute http(s) URL, always with scheme
using BaseURL = std::string; // Absolute URL truncated after its last '/', inclusive
using RelPath = std::string; // Path relative to a BaseURL, may contain '/' and a query

//[ DIRECTORY AND PATHS DEFS ]//
using Directory = std::string;
using AbsPath   = std::string; // Absolute filesystem path
using FileName  = std::string;

//[ PLAYLIST CONTENT ]//
using PlaylistData = std::string; // The playlist (.m3u8) content stored here
using PlaylistLine = std::string;

//[ MATCH CATALOG DEFS ]//
using MatchID      = std::string; // Opaque, numeric ids are kept in their decimal form
using CategoryName = std::string;

//[ STREAMING DEFS ]//
using ByteCount    = std::size_t;
using ChunkBuffer  = std::vector<char>;
using Milliseconds = std::chrono::milliseconds;
using Seconds      = std::chrono::seconds;
using SteadyClock  = std::chrono::steady_clock;
using TimePoint    = SteadyClock::time_point;

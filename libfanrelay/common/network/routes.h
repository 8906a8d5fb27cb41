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

namespace libfanrelay::routes
{

inline constexpr std::string_view SERVER_PATH_ROOT       = "/";
inline constexpr std::string_view SERVER_PATH_MATCHES    = "/matches";
inline constexpr std::string_view SERVER_PATH_MATCH_ITEM = "/matches/"; // + <id>
inline constexpr std::string_view SERVER_PATH_RELAY      = "/relay/";   // + <id>[/<path...>]
inline constexpr std::string_view SERVER_PATH_HEALTH     = "/health";
inline constexpr std::string_view SERVER_PATH_METRICS    = "/metrics";
inline constexpr std::string_view SERVER_QUERY_CDN       = "cdn";

} // namespace libfanrelay::routes

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

#include <string>
#include <string_view>

enum Macros
{
  FANRELAY_DEFAULT_PORT_NO         = 3000,
  FANRELAY_DEFAULT_IO_THREADS      = 4,
  FANRELAY_CATALOG_TTL_SECS        = 30,
  FANRELAY_CATALOG_TIMEOUT_SECS    = 5,
  FANRELAY_RELAY_TIMEOUT_SECS      = 10,
  FANRELAY_CLIENT_IDLE_SECS        = 30, // keep-alive wait for the next request
  FANRELAY_CLIENT_WRITE_SECS       = 30, // one write towards a client, header or chunk
  FANRELAY_STREAM_CHUNK_SIZE       = 64 * 1024, // bytes pulled from an origin per write
  FANRELAY_REQUEST_BODY_LIMIT      = 64 * 1024, // the relay only serves GET
  FANRELAY_UPSTREAM_HEADER_LIMIT   = 64 * 1024,
  FANRELAY_UPSTREAM_JSON_LIMIT_MIB = 16,
  FANRELAY_PLAYLIST_LIMIT_MIB      = 4
};

/// Basic string for Carriage Return Line Feed (CRLF)
#define CRLF "\r\n"

#define FANRELAY_RET_SUC  0
#define FANRELAY_RET_FAIL 1

#define STRING_CONSTANTS(X)                                                                   \
  /* File Extensions */                                                                       \
  X(PLAYLIST_EXT, ".m3u8")                                                                    \
  X(TRANSPORT_STREAM_EXT, ".ts")                                                              \
  X(HTML_FILE_EXT, ".html")                                                                   \
  X(TOML_FILE_EXT, ".toml")                                                                   \
                                                                                              \
  /* Playlist Content */                                                                      \
  X(PLAYLIST_GLOBAL_HEADER, "#EXTM3U")                                                        \
  X(PLAYLIST_TAG_PREFIX, "#")                                                                 \
  X(PLAYLIST_URI_ATTR, "URI=\"")                                                              \
                                                                                              \
  /* Content Types */                                                                         \
  X(CONTENT_TYPE_M3U8, "application/vnd.apple.mpegurl")                                       \
  X(CONTENT_TYPE_OCTET_STREAM, "application/octet-stream")                                    \
  X(CONTENT_TYPE_JSON, "application/json")                                                    \
  X(CONTENT_TYPE_TEXT, "text/plain; charset=utf-8")                                           \
  X(CONTENT_TYPE_PROMETHEUS, "text/plain; version=0.0.4")                                     \
                                                                                              \
  /* Upstream */                                                                              \
  X(DEFAULT_FEED_URL,                                                                         \
    "https://raw.githubusercontent.com/jitendra-unatti/fancode/main/data/fancode.json")      \
  X(DEFAULT_USER_AGENT, "Mozilla/5.0")                                                        \
  X(DEFAULT_CDN_VARIANT, "adfree_stream")                                                     \
                                                                                              \
  /* Server */                                                                                \
  X(SERVER_NAME, "fanrelay")                                                                  \
  X(DEFAULT_BIND_ADDRESS, "0.0.0.0")                                                          \
  X(DEFAULT_PUBLIC_DIR, "public")                                                             \
  X(DEFAULT_CONFIG_FILE, "fanrelay.toml")                                                     \
  X(INDEX_PAGE, "main.html")                                                                  \
  X(CORS_ALLOW_ALL, "*")                                                                      \
  X(CORS_ALLOW_METHODS, "GET, OPTIONS")                                                       \
                                                                                              \
  /* Logging */                                                                               \
  X(LOG_LEVEL_ENV, "FANRELAY_LOG_LEVEL")                                                      \
  X(REL_PATH_LOGS, ".cache/fanrelay/logs")

namespace macros
{

#define DECLARE_STRING_VIEW(name, value) constexpr std::string_view name = value;
STRING_CONSTANTS(DECLARE_STRING_VIEW)
#undef DECLARE_STRING_VIEW

// Convert string_view to string using a function (avoiding constexpr std::string)
inline auto to_string(std::string_view sv) -> std::string { return std::string(sv); }

} // namespace macros

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

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/regex.hpp>
#include <boost/thread.hpp>
#include <map>
#include <string>

#include <libfanrelay/common/api/entry.hpp>

/*
 * LOGGER
 *
 * Thin wrapper around the boost trivial logger.
 *
 * Every record gets a timestamp, a coloured severity and a category tag. The console sink
 * keeps the colours, the rotating file sink under ~/.cache/fanrelay/logs strips them.
 *
 * Categories are tag types (libfanrelay::log::RELAY, ...) so call sites read as
 *
 *    log::INFO<Relay>("Rewrote {} lines for match {}", n, id);
 *
 */

// Force ANSI Colors (Ignoring Terminal Themes)
#define RESET  "\033[0m\033[39m\033[49m" // Reset all styles and colors
#define BOLD   "\033[1m"                 // Bold text
#define RED    "\033[38;5;124m"          // Gruvbox Red (#cc241d)
#define GREEN  "\033[38;5;142m"          // Gruvbox Green (#98971a)
#define YELLOW "\033[38;5;214m"          // Gruvbox Yellow (#d79921)
#define BLUE   "\033[38;5;109m"          // Gruvbox Blue (#458588)
#define PURPLE "\033[38;5;141m"          // Gruvbox Purple (#b16286) -> For TRACE logs

constexpr const char* ANSI_REGEX = "\033\\[[0-9;]*m";

#define LOG_FMT(str) BOLD str RESET

#define LOG_CATEGORIES                  \
  X(SERVER, "#SERVER_LOG    ")          \
  X(SESSION, "#SESSION_LOG   ")         \
  X(NET, "#NETWORK_LOG   ")             \
  X(CATALOG, "#CATALOG_LOG   ")         \
  X(RELAY, "#RELAY_LOG     ")           \
  X(PROXY, "#PROXY_LOG     ")           \
  X(M3U8, "#M3U8_LOG      ")            \
  X(STATIC, "#STATIC_LOG    ")          \
  X(CONFIG, "#CONFIG_LOG    ")

namespace libfanrelay::log
{

// One empty tag type per category, the prefix is looked up at compile time
#define X(name, str)                                     \
  struct name                                            \
  {                                                      \
    static constexpr const char* prefix = LOG_FMT(str); \
  };
LOG_CATEGORIES
#undef X
#undef LOG_FMT

template <typename Tag> constexpr auto log_prefix() -> const char* { return Tag::prefix; }

// In priority order
enum SeverityLevel
{
  __ERROR__,
  __WARNING__,
  __INFO__,
  __DEBUG__,
  __TRACE__
};

inline const std::map<std::string, SeverityLevel> LOG_LEVEL_STR_MAP = {
  {"ERROR", __ERROR__}, {"WARN", __WARNING__}, {"WARNING", __WARNING__},
  {"INFO", __INFO__},   {"DEBUG", __DEBUG__},  {"TRACE", __TRACE__},
};

inline const std::map<SeverityLevel, boost::log::trivial::severity_level> LOG_LEVEL_ENUM_MAP = {
  {__ERROR__, boost::log::trivial::error}, {__WARNING__, boost::log::trivial::warning},
  {__INFO__, boost::log::trivial::info},   {__DEBUG__, boost::log::trivial::debug},
  {__TRACE__, boost::log::trivial::trace},
};

auto strip_ansi(const std::string& input) -> std::string;
auto get_current_timestamp() -> std::string;

// Console + rotating file sink, level from FANRELAY_LOG_LEVEL
FANRELAY_API void init_logging();
FANRELAY_API void set_log_level(SeverityLevel level);

inline void flush_logs() { boost::log::core::get()->flush(); }

#define THREAD_ID BOLD << "[Worker " << boost::this_thread::get_id() << "] " << RESET
#define LOG_INFO  BOOST_LOG_TRIVIAL(info)

} // namespace libfanrelay::log

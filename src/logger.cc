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
#include <boost/filesystem.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/logger.hpp>

namespace libfanrelay::log
{

namespace
{

namespace trivial = boost::log::trivial;

auto severity_tag(trivial::severity_level sev, bool colored) -> std::string
{
  switch (sev)
  {
    case trivial::trace:
      return colored ? PURPLE "[TRACE]   " : "[TRACE]   ";
    case trivial::debug:
      return colored ? BLUE "[DEBUG]   " : "[DEBUG]   ";
    case trivial::info:
      return colored ? GREEN "[INFO]    " : "[INFO]    ";
    case trivial::warning:
      return colored ? YELLOW "[WARN]    " : "[WARN]    ";
    default:
      return colored ? RED "[ERROR]   " : "[ERROR]   ";
  }
}

// The timestamp has to be taken per record, so both sinks use a plain function formatter
void format_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm,
                   bool colored)
{
  auto        severity    = rec[trivial::severity];
  auto        message_ref = rec[boost::log::expressions::smessage];
  std::string message     = message_ref ? message_ref.get() : "";
  const auto  sev         = severity ? severity.get() : trivial::info;

  if (colored)
  {
    strm << BOLD << "[" << get_current_timestamp() << "] " << severity_tag(sev, true) << RESET
         << message;
    return;
  }

  strm << "[" << get_current_timestamp() << "] " << severity_tag(sev, false) << strip_ansi(message);
}

} // namespace

auto strip_ansi(const std::string& input) -> std::string
{
  static const boost::regex ansi_regex(ANSI_REGEX);
  return boost::regex_replace(input, ansi_regex, "");
}

auto get_current_timestamp() -> std::string
{
  using namespace std::chrono;

  const auto        now    = system_clock::now();
  const auto        now_ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  const std::time_t t      = system_clock::to_time_t(now);
  std::tm           local{};
  localtime_r(&t, &local);

  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << now_ms.count();
  return oss.str();
}

void init_logging()
{
  namespace bfs     = boost::filesystem;
  namespace logging = boost::log;
  namespace sinks   = boost::log::sinks;
  namespace kw      = boost::log::keywords;

  auto console_sink = logging::add_console_log(std::cout);
  console_sink->set_formatter([](boost::log::record_view const&     rec,
                                 boost::log::formatting_ostream& strm)
                              { format_record(rec, strm, true); });

  const char* home = std::getenv("HOME");
  if (!home)
  {
    std::cerr << "WARN: Unable to determine HOME directory, file logging disabled.\n";
  }
  else
  {
    bfs::path                 log_dir = bfs::path(home) / macros::to_string(macros::REL_PATH_LOGS);
    boost::system::error_code ec;
    bfs::create_directories(log_dir, ec);

    if (ec)
    {
      std::cerr << "WARN: Failed to create log directory " << log_dir.string() << ": "
                << ec.message() << ", file logging disabled.\n";
    }
    else
    {
      const std::string log_file = (log_dir / "fanrelay_%Y-%m-%d_%H-%M-%S.log").string();

      // File logging (without ANSI codes)
      using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
      boost::shared_ptr<text_sink> file_sink =
        boost::make_shared<text_sink>(kw::file_name     = log_file,
                                      kw::rotation_size = 10 * 1024 * 1024, // 10 MB
                                      kw::auto_flush    = true);

      file_sink->set_formatter([](boost::log::record_view const&     rec,
                                  boost::log::formatting_ostream& strm)
                               { format_record(rec, strm, false); });

      logging::core::get()->add_sink(file_sink);
    }
  }

  logging::add_common_attributes();

  // Set log level from environment variable
  const char* env_level = std::getenv(macros::to_string(macros::LOG_LEVEL_ENV).c_str());

  if (env_level)
  {
    std::string level_str = env_level;
    std::ranges::for_each(level_str,
                          [](char& c) { c = std::toupper(static_cast<unsigned char>(c)); });

    auto it = LOG_LEVEL_STR_MAP.find(level_str);
    if (it != LOG_LEVEL_STR_MAP.end())
    {
      set_log_level(it->second);
      return;
    }

    std::cerr << "Invalid " << macros::LOG_LEVEL_ENV << ": " << level_str << ". Using default.\n";
  }

  set_log_level(__INFO__);
}

void set_log_level(SeverityLevel level)
{
  auto it = LOG_LEVEL_ENUM_MAP.find(level);
  if (it != LOG_LEVEL_ENUM_MAP.end())
  {
    boost::log::core::get()->set_filter(trivial::severity >= it->second);
    return;
  }

  std::cerr << "Unknown log level specified.\n";
}

} // namespace libfanrelay::log

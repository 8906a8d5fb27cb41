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

#include <libfanrelay/logger.hpp>

#include <format>
#include <string_view>
#include <type_traits>

#define INIT_FANRELAY_LOGGER()                                                                   \
  libfanrelay::log::init_logging();                                                              \
  LOG_INFO << "fanrelay logger initialized! Check FANRELAY_LOG_LEVEL (environment variable) for " \
              "which log level this session is on!!";

/* ------------ LOGGING MACROS --------------- */

// Async adds the thread id to the record, use it from anything that runs on the io threads
enum class LogMode
{
  Sync,
  Async
};

template <typename T, typename = void> struct is_formattable : std::false_type
{
};

template <typename T>
struct is_formattable<T, std::void_t<decltype(std::formatter<std::remove_cvref_t<T>, char>{})>>
    : std::true_type
{
};

template <typename... Args> constexpr bool all_formattable_v = (is_formattable<Args>::value && ...);

#define LOG_ARGS_TYPE_CHECK()                                                                    \
  static_assert(                                                                                 \
    all_formattable_v<Args...>,                                                                  \
    "One or more arguments passed to LOG MACROS are not formattable with std::format. Consider " \
    "converting types like std::filesystem::path to string using .string().");

namespace libfanrelay::log
{

namespace detail
{

template <typename Tag, typename... Args>
inline void emit(boost::log::trivial::severity_level sev, LogMode mode, std::string_view fmt,
                 Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();

  auto  formatted = std::vformat(fmt, std::make_format_args(args...));
  auto& lg        = ::boost::log::trivial::logger::get();
  if (mode == LogMode::Async)
    BOOST_LOG_SEV(lg, sev) << THREAD_ID << log_prefix<Tag>() << formatted;
  else
    BOOST_LOG_SEV(lg, sev) << log_prefix<Tag>() << formatted;
}

} // namespace detail

#define FANRELAY__DEFINE_LOG_FN(NAME, SEV)                                                 \
  template <typename Tag, typename... Args>                                                 \
  inline void NAME(LogMode mode, std::string_view fmt, Args&&... args)                      \
  {                                                                                         \
    detail::emit<Tag>(boost::log::trivial::SEV, mode, fmt, std::forward<Args>(args)...);    \
  }                                                                                         \
  template <typename Tag, typename... Args> inline void NAME(std::string_view fmt, Args&&... args) \
  {                                                                                         \
    detail::emit<Tag>(boost::log::trivial::SEV, LogMode::Sync, fmt,                         \
                      std::forward<Args>(args)...);                                         \
  }

FANRELAY__DEFINE_LOG_FN(INFO, info)
FANRELAY__DEFINE_LOG_FN(WARN, warning)
FANRELAY__DEFINE_LOG_FN(ERROR, error)
FANRELAY__DEFINE_LOG_FN(DBG, debug)
FANRELAY__DEFINE_LOG_FN(TRACE, trace)

#undef FANRELAY__DEFINE_LOG_FN

} // namespace libfanrelay::log

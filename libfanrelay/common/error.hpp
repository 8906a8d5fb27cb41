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

#include <exception>
#include <libfanrelay/common/types.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace libfanrelay
{

enum class ErrorKind
{
  NotFound,              // unknown match / variant
  SessionNotFound,       // segment asked for before its master playlist
  InvalidStream,         // URL present but not an HLS playlist
  InvalidRequest,        // rejected relative path (traversal, foreign origin)
  UpstreamUnavailable,   // origin answered with a non-2xx status
  UpstreamError,         // transport fault or timeout
  MalformedUpstreamData, // feed body is not a JSON object
};

inline auto to_string(ErrorKind kind) -> std::string_view
{
  switch (kind)
  {
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::SessionNotFound:
      return "SessionNotFound";
    case ErrorKind::InvalidStream:
      return "InvalidStream";
    case ErrorKind::InvalidRequest:
      return "InvalidRequest";
    case ErrorKind::UpstreamUnavailable:
      return "UpstreamUnavailable";
    case ErrorKind::UpstreamError:
      return "UpstreamError";
    case ErrorKind::MalformedUpstreamData:
      return "MalformedUpstreamData";
  }
  return "Unknown";
}

class RelayError : public std::runtime_error
{
public:
  RelayError(ErrorKind kind, const std::string& msg)
      : std::runtime_error(msg), m_kind(kind)
  {
  }

  RelayError(ErrorKind kind, const std::string& msg, HttpStatus upstream_status)
      : std::runtime_error(build_msg(msg, upstream_status)), m_kind(kind),
        m_upstreamStatus(upstream_status)
  {
  }

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return m_kind; }
  [[nodiscard]] auto upstream_status() const noexcept -> std::optional<HttpStatus>
  {
    return m_upstreamStatus;
  }

private:
  ErrorKind                 m_kind;
  std::optional<HttpStatus> m_upstreamStatus;

  static auto build_msg(const std::string& m, HttpStatus status) -> std::string
  {
    std::ostringstream oss;
    oss << m << " (upstream status " << status << ")";
    return oss.str();
  }
};

class ConfigError : public std::runtime_error
{
public:
  explicit ConfigError(const std::string& msg) : std::runtime_error("config: " + msg) {}
};

// what() of an error delivered to a completion handler
inline auto describe(const std::exception_ptr& err) -> std::string
{
  if (!err)
    return "no error";
  try
  {
    std::rethrow_exception(err);
  }
  catch (const std::exception& e)
  {
    return e.what();
  }
}

} // namespace libfanrelay

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

#include <boost/asio/any_io_executor.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/common/types.hpp>

/*
 * @UPSTREAM FETCHER
 *
 * Everything that leaves the process goes through IUpstreamFetcher::async_open():
 *
 *   - the JSON feed (catalog refresh)
 *   - master / media playlists (relay)
 *   - segments (proxy)
 *
 * All of it is asynchronous. The caller hands in the executor its own work runs on (for a
 * request that is the client connection's strand), the origin socket lives on that executor and
 * every completion handler is invoked through it, never from inside the initiating call.
 *
 * async_open() completes once the status line and headers are in. The body stays on the wire
 * and is pulled by the caller through UpstreamBody::async_read(), so a segment is never held in
 * memory as a whole and the origin is only read as fast as the client drains it.
 *
 * Transport faults and timeouts complete with a RelayError(ErrorKind::UpstreamError) in the
 * exception_ptr. A non-2xx status is NOT an error at this layer, the caller decides what it
 * means.
 *
 */

namespace libfanrelay::network
{

namespace asio = boost::asio;

// What `timeout` bounds
enum class TimeoutScope
{
  Idle,  // connect + head, then each body read on its own (streamed segments)
  Total, // the whole exchange from resolve to the last body byte (buffered fetches)
};

struct FetchOptions
{
  Milliseconds timeout{Seconds(FANRELAY_RELAY_TIMEOUT_SECS)};
  UserAgent    user_agent = macros::to_string(macros::DEFAULT_USER_AGENT);
  TimeoutScope scope      = TimeoutScope::Idle;
};

class UpstreamBody
{
public:
  using ReadHandler = std::function<void(std::exception_ptr, ByteCount)>;

  virtual ~UpstreamBody() = default;

  // Fills at most out.size() bytes, 0 means the body is complete. `out` must stay alive until
  // the handler runs.
  virtual void async_read(std::span<char> out, ReadHandler handler) = 0;

  // Drops the origin connection. A pending read completes, any later one yields 0.
  virtual void cancel() noexcept = 0;
};

struct UpstreamResponse
{
  HttpStatus                    status = 0;
  ContentType                   content_type; // empty when the origin sent none
  std::optional<ui64>           content_length;
  std::unique_ptr<UpstreamBody> body;

  [[nodiscard]] auto ok() const noexcept -> bool { return status >= 200 && status < 300; }
};

struct FetchResult
{
  HttpStatus  status = 0;
  ContentType content_type;
  std::string body;

  [[nodiscard]] auto ok() const noexcept -> bool { return status >= 200 && status < 300; }
};

class FANRELAY_API IUpstreamFetcher
{
public:
  using OpenHandler  = std::function<void(std::exception_ptr, UpstreamResponse)>;
  using FetchHandler = std::function<void(std::exception_ptr, FetchResult)>;

  virtual ~IUpstreamFetcher() = default;

  virtual void async_open(asio::any_io_executor ex, const AbsURL& url, const FetchOptions& opts,
                          OpenHandler handler) = 0;

  // Buffers the whole body under one overall deadline. Bodies of non-2xx responses are
  // discarded, anything larger than max_bytes is an UpstreamError.
  void async_fetch_all(asio::any_io_executor ex, const AbsURL& url, FetchOptions opts,
                       ByteCount max_bytes, FetchHandler handler);
};

} // namespace libfanrelay::network

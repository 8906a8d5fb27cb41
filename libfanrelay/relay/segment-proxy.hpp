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
#include <functional>
#include <memory>
#include <span>

#include <libfanrelay/network/fetcher.hpp>
#include <libfanrelay/relay/playlist-relay.hpp>
#include <libfanrelay/relay/session-store.hpp>

/*
 * @SegmentProxy
 *
 * GET /relay/{matchId}/{path...}
 *
 *   session base URL + path  ->  GET origin  ->  pipe() 64 KiB at a time into the client
 *
 * `path` is everything after "/relay/{matchId}/", nested directories and query included. It is
 * refused (InvalidRequest) when any segment decodes to "..", and an absolute http(s) path is
 * only accepted when it points at the same origin as the recorded base URL.
 *
 * async_pipe() reads the next origin chunk only from the completion of the sink that took the
 * previous one, so the origin is drained exactly as fast as the client:
 *
 *   body.async_read -> sink(chunk, done) -> done(true) -> body.async_read -> ... -> 0 bytes
 *                                        -> done(false): client gone, origin cancelled
 *
 */

namespace libfanrelay::relay
{

struct SegmentStream
{
  HttpStatus                             status = 0;
  ContentType                            content_type;
  std::optional<ui64>                    content_length;
  std::unique_ptr<network::UpstreamBody> body;
  AbsURL                                 origin_url;
};

// Delivers `chunk`, then calls `done` with whether it made it. The chunk stays valid until then.
using ChunkSink =
  std::function<void(std::span<const char> chunk, std::function<void(bool)> done)>;

struct PipeResult
{
  ByteCount bytes     = 0;
  bool      completed = false; // false: the sink gave up and the origin was cancelled
};

class FANRELAY_API SegmentProxy
{
public:
  SegmentProxy(RelaySessionStore& sessions, network::IUpstreamFetcher& fetcher, RelayOptions opts)
      : m_sessions(sessions), m_fetcher(fetcher), m_opts(std::move(opts))
  {
  }

  // Throws SessionNotFound or InvalidRequest, never touches the network
  [[nodiscard]] auto resolve(std::string_view match_id, std::string_view rel_path) const
    -> AbsURL;

  using SegmentHandler = std::function<void(std::exception_ptr, SegmentStream)>;
  using PipeHandler    = std::function<void(std::exception_ptr, PipeResult)>;

  // Fails with UpstreamUnavailable (carrying the origin status) or UpstreamError on top of
  // whatever resolve() throws
  void async_open_segment(asio::any_io_executor ex, std::string_view match_id,
                          std::string_view rel_path, SegmentHandler handler);

  // An origin fault after the first byte reaches `handler` as UpstreamError
  static void async_pipe(std::shared_ptr<SegmentStream> stream, ChunkSink sink,
                         PipeHandler handler);

private:
  RelaySessionStore&         m_sessions;
  network::IUpstreamFetcher& m_fetcher;
  RelayOptions               m_opts;
};

} // namespace libfanrelay::relay

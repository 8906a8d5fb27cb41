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

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/types.hpp>
#include <libfanrelay/network/fetcher.hpp>
#include <libfanrelay/network/url.hpp>

namespace ssl   = boost::asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace asio  = boost::asio;
using tcp       = asio::ip::tcp;

/*
 * @HttpsFetcher
 *
 * Beast based implementation of IUpstreamFetcher for http:// and https:// origins.
 *
 * One open is a chain of async operations on the caller's executor:
 *
 *   async_resolve -> async_connect -> [async_handshake] -> async_write -> async_read_header
 *
 * Deadlines, with `timeout` from FetchOptions:
 *
 *   TimeoutScope::Idle   resolve, then connect..head, then every body read: `timeout` each
 *   TimeoutScope::Total  one deadline of now + `timeout` shared by all of the above
 *
 * Resolution is bounded by a steady_timer that cancels the resolver, everything after it by
 * the tcp_stream expiry.
 *
 * Redirects are not followed. TLS uses SNI and, unless disabled, peer + hostname verification
 * against the system trust store.
 *
 */

namespace libfanrelay::network
{

class FANRELAY_API HttpsFetcher final : public IUpstreamFetcher
{
public:
  explicit HttpsFetcher(bool verify_tls = true);

  void async_open(asio::any_io_executor ex, const AbsURL& url, const FetchOptions& opts,
                  OpenHandler handler) override;

private:
  ssl::context m_sslCtx;
  bool         m_verifyTls;
};

} // namespace libfanrelay::network

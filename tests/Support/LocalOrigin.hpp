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

#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace fanrelay_test
{

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

// Plain HTTP origin on 127.0.0.1 that answers exactly one request
class LocalOrigin
{
public:
  using Request = http::request<http::string_body>;
  using Respond = std::function<void(tcp::socket&, const Request&)>;

  explicit LocalOrigin(Respond respond)
      : m_acceptor(m_ioc, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}),
        m_respond(std::move(respond))
  {
    m_thread = std::thread([this] { serve_one(); });
  }

  ~LocalOrigin()
  {
    // Unblocks accept() when the test never connected
    beast::error_code ec;
    tcp::socket       poke(m_ioc);
    poke.connect(m_acceptor.local_endpoint(ec), ec);
    poke.close(ec);

    if (m_thread.joinable())
      m_thread.join();
  }

  LocalOrigin(const LocalOrigin&)                    = delete;
  auto operator=(const LocalOrigin&) -> LocalOrigin& = delete;

  [[nodiscard]] auto url(const std::string& target) const -> std::string
  {
    return "http://127.0.0.1:" + std::to_string(m_acceptor.local_endpoint().port()) + target;
  }

  [[nodiscard]] auto last_request() const -> Request
  {
    std::lock_guard lock(m_mutex);
    return m_last;
  }

private:
  asio::io_context   m_ioc;
  tcp::acceptor      m_acceptor;
  Respond            m_respond;
  mutable std::mutex m_mutex;
  Request            m_last;
  std::thread        m_thread;

  void serve_one()
  {
    beast::error_code ec;
    tcp::socket       socket(m_ioc);
    m_acceptor.accept(socket, ec);
    if (ec)
      return;

    beast::flat_buffer buffer;
    Request            req;
    http::read(socket, buffer, req, ec);
    if (ec)
      return;

    {
      std::lock_guard lock(m_mutex);
      m_last = req;
    }
    m_respond(socket, req);
    socket.shutdown(tcp::socket::shutdown_both, ec);
  }
};

// Answers with `body`, chunked when `chunked` is set
inline auto respond_with(unsigned status, std::string body, std::string content_type,
                         bool chunked = false) -> LocalOrigin::Respond
{
  return [=](tcp::socket& socket, const LocalOrigin::Request& req)
  {
    http::response<http::string_body> res{static_cast<http::status>(status), req.version()};
    if (!content_type.empty())
      res.set(http::field::content_type, content_type);
    res.body() = body;
    if (chunked)
      res.chunked(true);
    else
      res.prepare_payload();
    res.keep_alive(false);

    beast::error_code ec;
    http::write(socket, res, ec);
  };
}

} // namespace fanrelay_test

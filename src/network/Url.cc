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
#include <cctype>
#include <charconv>

#include <libfanrelay/network/url.hpp>

namespace libfanrelay::network
{

namespace
{

auto to_lower(std::string_view in) -> std::string
{
  std::string out(in);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto hex_value(char c) -> int
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

auto Url::origin() const -> std::string
{
  return scheme + "://" + host_header();
}

auto Url::host_header() const -> std::string
{
  const bool  v6  = host.find(':') != std::string::npos;
  std::string out = v6 ? "[" + host + "]" : host;
  if (!default_port())
    out += ":" + std::to_string(port);
  return out;
}

auto parse_url(std::string_view url) -> std::optional<Url>
{
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos)
    return std::nullopt;

  Url out;
  out.scheme = to_lower(url.substr(0, scheme_end));
  if (out.scheme != "http" && out.scheme != "https")
    return std::nullopt;

  const auto authority_start = scheme_end + 3;
  auto       authority_end   = url.find_first_of("/?#", authority_start);
  if (authority_end == std::string_view::npos)
    authority_end = url.size();

  std::string_view authority = url.substr(authority_start, authority_end - authority_start);
  if (authority.empty() || authority.find('@') != std::string_view::npos)
    return std::nullopt;

  std::string_view host_part = authority;
  std::string_view port_part;

  if (authority.front() == '[')
  {
    const auto close = authority.find(']');
    if (close == std::string_view::npos)
      return std::nullopt;
    host_part = authority.substr(1, close - 1);
    if (close + 1 < authority.size())
    {
      if (authority[close + 1] != ':')
        return std::nullopt;
      port_part = authority.substr(close + 2);
    }
  }
  else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos)
  {
    host_part = authority.substr(0, colon);
    port_part = authority.substr(colon + 1);
  }

  if (host_part.empty())
    return std::nullopt;

  out.host = to_lower(host_part);
  out.port = out.is_tls() ? 443 : 80;

  if (!port_part.empty())
  {
    unsigned port  = 0;
    auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), port);
    if (ec != std::errc() || ptr != port_part.data() + port_part.size() || port == 0 ||
        port > 65535)
      return std::nullopt;
    out.port = static_cast<PortNo>(port);
  }

  std::string_view rest = url.substr(authority_end);
  // Fragments never go over the wire
  if (const auto hash = rest.find('#'); hash != std::string_view::npos)
    rest = rest.substr(0, hash);

  if (rest.empty() || rest.front() == '?')
    out.target = "/" + std::string(rest);
  else
    out.target = std::string(rest);

  return out;
}

auto is_absolute_http_url(std::string_view url) -> bool { return parse_url(url).has_value(); }

auto base_directory_url(std::string_view url) -> BaseURL
{
  const auto path = split_query(url).first;

  const auto scheme_end = path.find("://");
  const auto path_start =
    scheme_end == std::string_view::npos ? std::string_view::npos : path.find('/', scheme_end + 3);

  if (path_start == std::string_view::npos)
    return std::string(path) + "/";

  return std::string(path.substr(0, path.rfind('/') + 1));
}

auto split_query(std::string_view target) -> std::pair<std::string_view, std::string_view>
{
  const auto q = target.find('?');
  if (q == std::string_view::npos)
    return {target, {}};
  return {target.substr(0, q), target.substr(q)};
}

auto percent_decode(std::string_view in) -> std::string
{
  std::string out;
  out.reserve(in.size());

  for (std::size_t i = 0; i < in.size(); ++i)
  {
    if (in[i] == '%' && i + 2 < in.size())
    {
      const int hi = hex_value(in[i + 1]);
      const int lo = hex_value(in[i + 2]);
      if (hi >= 0 && lo >= 0)
      {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(in[i]);
  }

  return out;
}

auto percent_encode_segment(std::string_view in) -> std::string
{
  constexpr std::string_view HEX = "0123456789ABCDEF";

  std::string out;
  out.reserve(in.size());

  for (const char c : in)
  {
    const auto byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) || c == '-' || c == '.' || c == '_' || c == '~')
    {
      out.push_back(c);
      continue;
    }
    out.push_back('%');
    out.push_back(HEX[byte >> 4]);
    out.push_back(HEX[byte & 0x0F]);
  }

  return out;
}

auto has_parent_traversal(std::string_view rel_path) -> bool
{
  const auto        path    = split_query(rel_path).first;
  const std::string decoded = percent_decode(path);

  std::size_t start = 0;
  while (start <= decoded.size())
  {
    auto end = decoded.find_first_of("/\\", start);
    if (end == std::string::npos)
      end = decoded.size();

    if (std::string_view(decoded).substr(start, end - start) == "..")
      return true;

    start = end + 1;
  }

  return false;
}

auto same_origin(const Url& a, const Url& b) -> bool
{
  return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
}

} // namespace libfanrelay::network

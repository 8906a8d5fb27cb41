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
#include <filesystem>
#include <fstream>
#include <iterator>

#include <libfanrelay/common/error.hpp>
#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/network/url.hpp>
#include <libfanrelay/server/static.hpp>

namespace fs = std::filesystem;

using Static = libfanrelay::log::STATIC;

namespace libfanrelay::server
{

auto detect_mime_type(std::string_view filename) -> ContentType
{
  struct Mapping
  {
    std::string_view ext;
    std::string_view type;
  };

  static constexpr Mapping kTypes[] = {
    {".html", "text/html; charset=utf-8"},
    {".htm", "text/html; charset=utf-8"},
    {".css", "text/css; charset=utf-8"},
    {".js", "application/javascript; charset=utf-8"},
    {".json", "application/json"},
    {".m3u8", "application/vnd.apple.mpegurl"},
    {".ts", "video/mp2t"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".svg", "image/svg+xml"},
    {".ico", "image/x-icon"},
    {".txt", "text/plain; charset=utf-8"},
  };

  for (const auto& [ext, type] : kTypes)
    if (filename.ends_with(ext))
      return ContentType(type);

  return macros::to_string(macros::CONTENT_TYPE_OCTET_STREAM);
}

auto load_static_file(const Directory& public_dir, std::string_view url_path) -> StaticFile
{
  if (network::has_parent_traversal(url_path))
  {
    log::WARN<Static>(LogMode::Async, "Rejected traversal in static path '{}'", url_path);
    throw RelayError(ErrorKind::InvalidRequest, "Invalid path");
  }

  std::string_view rel = url_path;
  while (rel.starts_with('/'))
    rel.remove_prefix(1);

  fs::path file = fs::path(public_dir) /
                  (rel.empty() ? macros::to_string(macros::INDEX_PAGE) : std::string(rel));

  std::error_code ec;
  if (fs::is_directory(file, ec))
    file /= macros::to_string(macros::INDEX_PAGE);

  if (!fs::is_regular_file(file, ec))
  {
    log::DBG<Static>(LogMode::Async, "No static file for '{}' ({})", url_path, file.string());
    throw RelayError(ErrorKind::NotFound, "Not found");
  }

  // Symlinks must not lead out of the public directory either
  std::error_code root_ec;
  auto            root     = fs::weakly_canonical(public_dir, root_ec);
  const auto      resolved = fs::weakly_canonical(file, ec);
  if (root.has_parent_path() && root.filename().empty())
    root = root.parent_path();
  const bool inside =
    !ec && !root_ec &&
    std::mismatch(root.begin(), root.end(), resolved.begin(), resolved.end()).first == root.end();
  if (!inside)
  {
    log::WARN<Static>(LogMode::Async, "Static path '{}' resolves outside {}", url_path,
                      public_dir);
    throw RelayError(ErrorKind::NotFound, "Not found");
  }

  std::ifstream ifs(resolved, std::ios::binary);
  if (!ifs)
    throw RelayError(ErrorKind::NotFound, "Not found");

  StaticFile out;
  out.body         = {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  out.content_type = detect_mime_type(resolved.filename().string());
  out.path         = resolved.string();

  log::TRACE<Static>(LogMode::Async, "Serving {} ({} bytes) [{}]", out.path, out.body.size(),
                     out.content_type);
  return out;
}

} // namespace libfanrelay::server

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

#include <string_view>

#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/types.hpp>

namespace libfanrelay::server
{

struct StaticFile
{
  ContentType content_type;
  std::string body;
  AbsPath     path;
};

FANRELAY_API auto detect_mime_type(std::string_view filename) -> ContentType;

// `url_path` is the decoded request path. "/" maps to the index page.
// Throws RelayError(InvalidRequest) on traversal and RelayError(NotFound) when nothing is there.
FANRELAY_API auto load_static_file(const Directory& public_dir, std::string_view url_path)
  -> StaticFile;

} // namespace libfanrelay::server

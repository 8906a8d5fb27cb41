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

#include <filesystem>
#include <format>
#include <map>
#include <string>

#include <libfanrelay/catalog/catalog.hpp>
#include <libfanrelay/common/macros.hpp>
#include <libfanrelay/common/types.hpp>
#include <libfanrelay/relay/session-store.hpp>

namespace fs = std::filesystem;

namespace libfanrelay::server
{

class HealthChecker
{
public:
  struct HealthStatus
  {
    bool                               is_healthy     = true;
    std::string                        status_message = "OK";
    std::map<std::string, std::string> checks;
  };

  // The catalog is only read here, never refreshed: a health check must not hit the feed
  static auto check(const Directory& public_dir, const catalog::MatchCatalog& catalog,
                    const relay::RelaySessionStore& sessions) -> HealthStatus
  {
    HealthStatus status;

    const fs::path  index = fs::path(public_dir) / macros::to_string(macros::INDEX_PAGE);
    std::error_code ec;
    if (!fs::is_directory(public_dir, ec))
    {
      status.is_healthy           = false;
      status.checks["public_dir"] = "FAIL - " + public_dir + " is not a directory";
    }
    else if (!fs::is_regular_file(index, ec))
    {
      status.is_healthy           = false;
      status.checks["public_dir"] = "FAIL - " + index.string() + " is missing";
    }
    else
    {
      status.checks["public_dir"] = "OK";
    }

    // An empty or stale catalog is normal, the next request refreshes it
    if (const auto snap = catalog.cached(); !snap)
      status.checks["catalog"] = "EMPTY - not fetched yet";
    else if (catalog.is_stale())
      status.checks["catalog"] = std::format("STALE - {} matches, refresh on next request",
                                             snap->total());
    else
      status.checks["catalog"] = std::format("OK - {} matches, {} live", snap->total(),
                                             snap->live_count);

    status.checks["catalog_fetches"] = std::to_string(catalog.fetch_count());
    status.checks["relay_sessions"]  = std::to_string(sessions.size());

    if (!status.is_healthy)
      status.status_message = "UNHEALTHY";

    return status;
  }
};

} // namespace libfanrelay::server

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

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/types.hpp>

namespace libfanrelay::relay
{

// match id -> base directory URL of the last master playlist fetched for it.
//
// Keyed on the match id alone: two variants of one match share (and overwrite) one entry, since
// /relay/{id}/{path} carries no variant. Entries never expire.
class FANRELAY_API RelaySessionStore
{
public:
  void record(const MatchID& match_id, BaseURL base)
  {
    std::unique_lock lock(m_mutex);
    m_bases.insert_or_assign(match_id, std::move(base));
  }

  [[nodiscard]] auto base_url(std::string_view match_id) const -> std::optional<BaseURL>
  {
    std::shared_lock lock(m_mutex);
    const auto       it = m_bases.find(MatchID(match_id));
    if (it == m_bases.end())
      return std::nullopt;
    return it->second;
  }

  [[nodiscard]] auto size() const -> std::size_t
  {
    std::shared_lock lock(m_mutex);
    return m_bases.size();
  }

private:
  mutable std::shared_mutex            m_mutex;
  std::unordered_map<MatchID, BaseURL> m_bases;
};

} // namespace libfanrelay::relay

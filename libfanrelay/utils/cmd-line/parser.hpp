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

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <libfanrelay/common/api/entry.hpp>
#include <libfanrelay/common/error.hpp>

/*
 * @CmdLineParser
 *
 * Accepts
 *
 *   --key=value
 *   --key value      (when the next token does not start with '-')
 *   --flag           (stored as "true")
 *   -h / --help
 *
 * Values are looked up lazily by key. Every lookup marks the key as known, so whatever is left
 * unread after configuration has been applied is reported by unknown_args().
 *
 * A value that does not parse as the requested type is a ConfigError, never a silent default.
 *
 */

namespace libfanrelay::utils::cmdline
{

struct CmdArg
{
  std::string key;
  std::string value_hint; // empty for plain flags
  std::string description;
};

class FANRELAY_API CmdLineParser
{
public:
  explicit CmdLineParser(std::span<char* const> argv)
  {
    if (!argv.empty() && argv[0] != nullptr)
      m_program = argv[0];

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
      const std::string arg = argv[i];
      if (arg == "-h" || arg == "--help")
      {
        m_args["help"] = "true";
        continue;
      }

      if (!arg.starts_with("--") || arg.size() == 2)
        throw ConfigError("invalid argument '" + arg + "', expected --key=value");

      if (const auto eq = arg.find('='); eq != std::string::npos)
      {
        m_args[arg.substr(2, eq - 2)] = arg.substr(eq + 1);
        continue;
      }

      const bool next_is_value =
        i + 1 < argv.size() && argv[i + 1] != nullptr && argv[i + 1][0] != '-';
      m_args[arg.substr(2)] = next_is_value ? std::string(argv[++i]) : "true";
    }
  }

  void register_args(std::initializer_list<CmdArg> args)
  {
    m_registered.insert(m_registered.end(), args.begin(), args.end());
  }

  template <typename T> auto get(const std::string& key) const -> std::optional<T>
  {
    m_accessed.insert(key);
    const auto it = m_args.find(key);
    if (it == m_args.end())
      return std::nullopt;

    auto parsed = parse_value<T>(it->second);
    if (!parsed)
      throw ConfigError("--" + key + " has an invalid value '" + it->second + "'");
    return parsed;
  }

  template <typename T> auto get_or(const std::string& key, T fallback) const -> T
  {
    return get<T>(key).value_or(std::move(fallback));
  }

  [[nodiscard]] auto has(const std::string& key) const -> bool
  {
    m_accessed.insert(key);
    return m_args.contains(key);
  }

  [[nodiscard]] auto wants_help() const -> bool { return has("help"); }

  [[nodiscard]] auto unknown_args() const -> std::vector<std::string>
  {
    std::vector<std::string> out;
    for (const auto& [key, val] : m_args)
      if (!m_accessed.contains(key))
        out.push_back("--" + key + (val != "true" ? "=" + val : ""));
    return out;
  }

  void print_usage(std::ostream& os) const
  {
    os << "Usage: " << m_program << " [options]\n\nOptions:\n";

    std::size_t width = 0;
    for (const auto& arg : m_registered)
      width = std::max(width, label(arg).size());

    for (const auto& arg : m_registered)
      os << "  " << std::left << std::setw(static_cast<int>(width + 2)) << label(arg)
         << arg.description << '\n';
  }

private:
  std::string                        m_program = "fanrelay-server";
  std::map<std::string, std::string> m_args;
  mutable std::set<std::string>      m_accessed;
  std::vector<CmdArg>                m_registered;

  static auto label(const CmdArg& arg) -> std::string
  {
    return "--" + arg.key + (arg.value_hint.empty() ? "" : "=<" + arg.value_hint + ">");
  }

  template <typename T> static auto parse_value(const std::string& s) -> std::optional<T>
  {
    if constexpr (std::is_same_v<T, std::string>)
    {
      return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      std::string v = s;
      std::ranges::transform(v, v.begin(), [](unsigned char c) { return std::tolower(c); });
      if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
      if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
      return std::nullopt;
    }
    else
    {
      static_assert(std::is_integral_v<T>, "CmdLineParser only parses strings, bools and ints");
      T out{};
      const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
      if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
      return out;
    }
  }
};

} // namespace libfanrelay::utils::cmdline

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

#if __cplusplus < 202002L
#error "fanrelay requires C++20 or later."
#endif

#include <iostream>
#include <span>

#include <libfanrelay/config/config.hpp>
#include <libfanrelay/log-macros.hpp>
#include <libfanrelay/server/server.hpp>

namespace lfr = libfanrelay;

using Server = lfr::log::SERVER;

auto main(int argc, char* argv[]) -> int
{
  INIT_FANRELAY_LOGGER();

  try
  {
    lfr::utils::cmdline::CmdLineParser cli(
      std::span<char* const>(argv, static_cast<std::size_t>(argc)));
    lfr::config::register_cli_args(cli);

    if (cli.wants_help())
    {
      cli.print_usage(std::cout);
      return FANRELAY_RET_SUC;
    }

    const auto cfg = lfr::config::load(cli);

    // Only meaningful once load() has asked for every known flag
    for (const auto& unknown : cli.unknown_args())
      lfr::log::WARN<Server>("Ignoring unknown option {}", unknown);

    lfr::log::INFO<Server>("Starting fanrelay ({})", lfr::config::describe(cfg));

    lfr::server::RelayServer server(cfg);
    server.run();
  }
  catch (const lfr::ConfigError& e)
  {
    lfr::log::ERROR<Server>("{}", e.what());
    std::cerr << "Run with --help to see the accepted options.\n";
    lfr::log::flush_logs();
    return FANRELAY_RET_FAIL;
  }
  catch (const std::exception& e)
  {
    lfr::log::ERROR<Server>("fanrelay Server Exception: {}", e.what());
    lfr::log::flush_logs();
    return FANRELAY_RET_FAIL;
  }

  lfr::log::flush_logs();
  return FANRELAY_RET_SUC;
}

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

#include <libfanrelay/server/metrics.hpp>

namespace libfanrelay::server
{

// Scoped per-request accounting: counts the request on entry and its latency on exit
class RequestTimer
{
public:
  explicit RequestTimer(Metrics& metrics) : m_metrics(metrics), m_start(SteadyClock::now())
  {
    ++m_metrics.total_requests;
    ++m_metrics.in_flight_requests;
  }

  RequestTimer(const RequestTimer&)                    = delete;
  auto operator=(const RequestTimer&) -> RequestTimer& = delete;

  ~RequestTimer()
  {
    m_metrics.record_response_time(
      std::chrono::duration_cast<Milliseconds>(SteadyClock::now() - m_start));
    --m_metrics.in_flight_requests;
  }

  void mark_status(HttpStatus status) { m_metrics.record_status(status); }

private:
  Metrics&                m_metrics;
  SteadyClock::time_point m_start;
};

} // namespace libfanrelay::server

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

#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

#include <libfanrelay/common/types.hpp>

namespace libfanrelay::server
{

struct Metrics
{
  std::atomic<ui64> total_requests{0};
  std::atomic<ui64> successful_requests{0};
  std::atomic<ui64> failed_requests{0};
  std::atomic<ui64> in_flight_requests{0};

  std::atomic<ui64> catalog_requests{0};
  std::atomic<ui64> playlist_requests{0};
  std::atomic<ui64> segment_requests{0};
  std::atomic<ui64> static_requests{0};

  std::atomic<ui64> bytes_relayed{0};
  std::atomic<ui64> streams_cancelled{0};
  std::atomic<ui64> upstream_failures{0};

  std::atomic<ui64> active_connections{0};
  std::atomic<ui64> total_connections{0};

  std::atomic<ui64> error_400_count{0};
  std::atomic<ui64> error_404_count{0};
  std::atomic<ui64> error_405_count{0};
  std::atomic<ui64> error_500_count{0};
  std::atomic<ui64> error_other_count{0};

  // Fixed window of the most recent response times
  static constexpr std::size_t MAX_RESPONSE_TIMES = 1000;

  SteadyClock::time_point start_time;

  Metrics() : start_time(SteadyClock::now()) {}

  void record_response_time(Milliseconds duration)
  {
    std::lock_guard lock(m_timesMutex);
    m_times[m_next] = duration;
    m_next          = (m_next + 1) % MAX_RESPONSE_TIMES;
    if (m_count < MAX_RESPONSE_TIMES)
      ++m_count;
  }

  [[nodiscard]] auto get_avg_response_time() const -> double
  {
    std::lock_guard lock(m_timesMutex);
    if (m_count == 0)
      return 0.0;

    Milliseconds total{0};
    for (std::size_t i = 0; i < m_count; ++i)
      total += m_times[i];
    return static_cast<double>(total.count()) / static_cast<double>(m_count);
  }

  void record_status(HttpStatus status)
  {
    if (status < 400)
    {
      ++successful_requests;
      return;
    }

    ++failed_requests;
    switch (status)
    {
      case 400:
        ++error_400_count;
        break;
      case 404:
        ++error_404_count;
        break;
      case 405:
        ++error_405_count;
        break;
      case 500:
        ++error_500_count;
        break;
      default:
        ++error_other_count;
    }
  }

  [[nodiscard]] auto get_uptime() const -> Seconds
  {
    return std::chrono::duration_cast<Seconds>(SteadyClock::now() - start_time);
  }

private:
  mutable std::mutex                           m_timesMutex;
  std::array<Milliseconds, MAX_RESPONSE_TIMES> m_times{};
  std::size_t                                  m_next  = 0;
  std::size_t                                  m_count = 0;
};

// Values owned by other components, sampled when /metrics is served
struct MetricsGauges
{
  ui64 catalog_fetches = 0;
  ui64 catalog_matches = 0;
  ui64 relay_sessions  = 0;
};

class MetricsSerializer
{
public:
  static auto to_prometheus_format(const Metrics& m, const MetricsGauges& g) -> std::string
  {
    std::ostringstream out;

    auto metric = [&out](std::string_view name, std::string_view type, std::string_view help,
                         const auto& value)
    {
      out << "# HELP " << name << " " << help << "\n";
      out << "# TYPE " << name << " " << type << "\n";
      out << name << " " << value << "\n\n";
    };

    auto by_status = [&out](std::string_view code, const std::atomic<ui64>& value)
    {
      out << "fanrelay_responses_failed_total{code=\"" << code << "\"} " << value.load()
          << "\n";
    };

    metric("fanrelay_requests_total", "counter", "Total number of HTTP requests",
           m.total_requests.load());
    metric("fanrelay_requests_successful", "counter", "Requests answered below 400",
           m.successful_requests.load());
    metric("fanrelay_requests_failed", "counter", "Requests answered with 400 or above",
           m.failed_requests.load());
    metric("fanrelay_requests_in_flight", "gauge", "Requests currently being handled",
           m.in_flight_requests.load());

    out << "# HELP fanrelay_responses_failed_total Failed responses by status code\n";
    out << "# TYPE fanrelay_responses_failed_total counter\n";
    by_status("400", m.error_400_count);
    by_status("404", m.error_404_count);
    by_status("405", m.error_405_count);
    by_status("500", m.error_500_count);
    by_status("other", m.error_other_count);
    out << "\n";

    metric("fanrelay_catalog_requests_total", "counter", "Requests to /matches",
           m.catalog_requests.load());
    metric("fanrelay_playlist_requests_total", "counter", "Master playlist requests",
           m.playlist_requests.load());
    metric("fanrelay_segment_requests_total", "counter", "Segment proxy requests",
           m.segment_requests.load());
    metric("fanrelay_static_requests_total", "counter", "Static file requests",
           m.static_requests.load());

    metric("fanrelay_relayed_bytes_total", "counter", "Segment bytes streamed to clients",
           m.bytes_relayed.load());
    metric("fanrelay_streams_cancelled_total", "counter",
           "Segment streams cut short by the client", m.streams_cancelled.load());
    metric("fanrelay_upstream_failures_total", "counter",
           "Origin fetches that failed or answered non-2xx", m.upstream_failures.load());

    metric("fanrelay_active_connections", "gauge", "Open client connections",
           m.active_connections.load());
    metric("fanrelay_connections_total", "counter", "Accepted client connections",
           m.total_connections.load());
    metric("fanrelay_response_time_avg", "gauge", "Average response time in milliseconds",
           m.get_avg_response_time());
    metric("fanrelay_uptime_seconds", "gauge", "Server uptime in seconds",
           m.get_uptime().count());

    metric("fanrelay_catalog_fetches_total", "counter", "Upstream feed fetches",
           g.catalog_fetches);
    metric("fanrelay_catalog_matches", "gauge", "Matches in the current snapshot",
           g.catalog_matches);
    metric("fanrelay_relay_sessions", "gauge", "Matches with a recorded base URL",
           g.relay_sessions);

    return out.str();
  }
};

} // namespace libfanrelay::server

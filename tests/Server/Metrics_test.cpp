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

#include <gtest/gtest.h>

#include <libfanrelay/server/metrics.hpp>
#include <libfanrelay/server/request-timer.hpp>

using namespace libfanrelay::server;

TEST(Metrics, StatusBuckets)
{
  Metrics m;
  m.record_status(200);
  m.record_status(302);
  m.record_status(400);
  m.record_status(404);
  m.record_status(404);
  m.record_status(405);
  m.record_status(500);
  m.record_status(503);

  EXPECT_EQ(m.successful_requests.load(), 2u);
  EXPECT_EQ(m.failed_requests.load(), 6u);
  EXPECT_EQ(m.error_400_count.load(), 1u);
  EXPECT_EQ(m.error_404_count.load(), 2u);
  EXPECT_EQ(m.error_405_count.load(), 1u);
  EXPECT_EQ(m.error_500_count.load(), 1u);
  EXPECT_EQ(m.error_other_count.load(), 1u);
}

TEST(Metrics, AverageOverWindow)
{
  Metrics m;
  EXPECT_DOUBLE_EQ(m.get_avg_response_time(), 0.0);

  m.record_response_time(Milliseconds(10));
  m.record_response_time(Milliseconds(30));
  EXPECT_DOUBLE_EQ(m.get_avg_response_time(), 20.0);

  for (std::size_t i = 0; i < Metrics::MAX_RESPONSE_TIMES; ++i)
    m.record_response_time(Milliseconds(4));
  EXPECT_DOUBLE_EQ(m.get_avg_response_time(), 4.0);
}

TEST(RequestTimer, TracksInFlightAndStatus)
{
  Metrics m;
  {
    RequestTimer timer(m);
    EXPECT_EQ(m.in_flight_requests.load(), 1u);
    timer.mark_status(404);
  }
  EXPECT_EQ(m.in_flight_requests.load(), 0u);
  EXPECT_EQ(m.total_requests.load(), 1u);
  EXPECT_EQ(m.error_404_count.load(), 1u);
}

TEST(MetricsSerializer, PrometheusText)
{
  Metrics m;
  m.bytes_relayed = 4096;
  m.record_status(404);

  MetricsGauges gauges;
  gauges.relay_sessions = 3;

  const auto text = MetricsSerializer::to_prometheus_format(m, gauges);
  EXPECT_NE(text.find("# TYPE fanrelay_relayed_bytes_total counter"), std::string::npos);
  EXPECT_NE(text.find("fanrelay_relayed_bytes_total 4096"), std::string::npos);
  EXPECT_NE(text.find("fanrelay_responses_failed_total{code=\"404\"} 1"), std::string::npos);
  EXPECT_NE(text.find("fanrelay_relay_sessions 3"), std::string::npos);
}

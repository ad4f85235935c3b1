/***
 * Name: test_metrics
 * Purpose: Metrics text/JSON summaries and derived hints.
 */
#include <gtest/gtest.h>
#include <string>
#include "shdoc/observability/metrics.h"

using shdoc::obs::Metrics;

TEST(Metrics, TimersRecordDurations) {
  Metrics m;
  m.start("Scan");
  m.stop("Scan");
  m.stop("Never");
  EXPECT_EQ(m.durations().count("Scan"), 1u);
  EXPECT_EQ(m.durations().count("Never"), 0u);
  const std::string json = m.summaryJson();
  EXPECT_NE(json.find("\"scan\""), std::string::npos);
}

TEST(Metrics, CountersInTextAndJson) {
  Metrics m;
  m.incCounter("scan.lines", 10);
  m.incCounter("scan.lines");
  m.setGauge("files", 1);
  EXPECT_EQ(m.counters().at("scan.lines"), 11u);
  const std::string text = m.summaryText();
  EXPECT_NE(text.find("== Metrics =="), std::string::npos);
  EXPECT_NE(text.find("  scan.lines = 11"), std::string::npos);
  const std::string json = m.summaryJson();
  EXPECT_NE(json.find("\"counters\""), std::string::npos);
  EXPECT_NE(json.find("\"scan.lines\": 11"), std::string::npos);
  EXPECT_NE(json.find("\"gauges\""), std::string::npos);
}

TEST(Metrics, HintsFromCounters) {
  Metrics none;
  none.setCounter("scan.functions", 0);
  ASSERT_EQ(none.hints().size(), 1u);
  EXPECT_EQ(none.hints()[0], "no_functions_found");

  Metrics filtered;
  filtered.setCounter("scan.functions", 2);
  filtered.setCounter("emit.records", 0);
  filtered.setCounter("scan.discarded_headers", 1);
  const auto hints = filtered.hints();
  ASSERT_EQ(hints.size(), 2u);
  EXPECT_EQ(hints[0], "unconfirmed_headers_present");
  EXPECT_EQ(hints[1], "all_records_filtered");
  EXPECT_NE(filtered.summaryJson().find("\"hints\": [\"unconfirmed_headers_present\", \"all_records_filtered\"]"),
            std::string::npos);
}

TEST(Metrics, NoHintsWhenHealthy) {
  Metrics m;
  m.setCounter("scan.functions", 3);
  m.setCounter("emit.records", 3);
  m.setCounter("scan.discarded_headers", 0);
  EXPECT_TRUE(m.hints().empty());
  EXPECT_EQ(m.summaryJson().find("hints"), std::string::npos);
}

#include "chunkforge/utilities/metrics.h"
#include <gtest/gtest.h>

using chunkforge::MetricsRegistry;

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
  std::map<std::string, std::string> labels{{"result", "success"}, {"a", "b"}};
  std::string formatted = MetricsRegistry::labelsToString(labels);
  // Map iteration is ordered, so "a" should come before "result".
  EXPECT_EQ(formatted, "{a=\"b\",result=\"success\"}");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
  MetricsRegistry::instance().reset();
  MetricsRegistry::instance().setGauge("active_merges", 2, {{"host", "localhost"}});
  MetricsRegistry::instance().incrementCounter("chunkforge_chunks_stored_total", 3);
  MetricsRegistry::instance().observe("chunkforge_merge_seconds", 1.5);
  std::string metrics = MetricsRegistry::instance().toPrometheus();
  EXPECT_NE(metrics.find("active_merges{host=\"localhost\"} 2"), std::string::npos);
  EXPECT_NE(metrics.find("chunkforge_chunks_stored_total 3"), std::string::npos);
  EXPECT_NE(metrics.find("chunkforge_merge_seconds_sum 1.5"), std::string::npos);
  EXPECT_NE(metrics.find("chunkforge_merge_seconds_count 1"), std::string::npos);
  MetricsRegistry::instance().reset();
  EXPECT_TRUE(MetricsRegistry::instance().toPrometheus().empty());
}

TEST(MetricsRegistry, CounterValueByLabels) {
  auto &registry = MetricsRegistry::instance();
  registry.reset();
  registry.incrementCounter("chunkforge_merges_total", 1, {{"result", "success"}});
  registry.incrementCounter("chunkforge_merges_total", 1, {{"result", "success"}});
  registry.incrementCounter("chunkforge_merges_total", 1, {{"result", "rejected"}});
  EXPECT_DOUBLE_EQ(
      registry.counterValue("chunkforge_merges_total", {{"result", "success"}}), 2);
  EXPECT_DOUBLE_EQ(
      registry.counterValue("chunkforge_merges_total", {{"result", "rejected"}}), 1);
  EXPECT_DOUBLE_EQ(registry.counterValue("chunkforge_merges_total"), 0);
  EXPECT_DOUBLE_EQ(registry.counterValue("never_touched"), 0);
  registry.reset();
}

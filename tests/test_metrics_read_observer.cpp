#include "core/metrics_manager.hpp"
#include "fakes/scripted_partition_client.hpp"
#include "reader/logging_read_observer.hpp"
#include "reader/metrics_read_observer.hpp"
#include "reader/read_observer.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using namespace range_reader;

namespace {

// Every test uses its own topic since the registry is process-wide.
PartitionRange range_for(const std::string &topic) {
  return PartitionRange{{topic, 2}, 0, 100};
}

MetricLabels labels_for(const std::string &topic) {
  return {{"topic", topic}, {"partition", "2"}};
}

LabeledCounter *counter(const std::string &name) {
  return MetricsManager::instance().register_labeled_counter(name, "");
}

} // namespace

TEST(MetricsReadObserverTest, CountsFetchSignals) {
  MetricsReadObserver observer(range_for("metrics-fetch"));
  const auto labels = labels_for("metrics-fetch");

  observer.on_retry(2);
  observer.on_retry(3);
  observer.on_empty_batch();
  observer.on_batch(40);
  observer.on_batch(2);

  EXPECT_EQ(counter("orr_fetch_retries_total")->get_value(labels), 2u);
  EXPECT_EQ(counter("orr_fetch_empty_batches_total")->get_value(labels), 1u);
  EXPECT_EQ(counter("orr_fetch_batches_total")->get_value(labels), 2u);
  EXPECT_EQ(counter("orr_fetch_records_total")->get_value(labels), 42u);
}

TEST(MetricsReadObserverTest, CountsSkippedOffsets) {
  MetricsReadObserver observer(range_for("metrics-gaps"));
  const auto labels = labels_for("metrics-gaps");

  observer.on_offset_gap(10, 15);
  observer.on_offset_gap(15, 17);

  EXPECT_EQ(counter("orr_offset_gaps_total")->get_value(labels), 2u);
  EXPECT_EQ(counter("orr_skipped_offsets_total")->get_value(labels), 5u);
}

TEST(MetricsReadObserverTest, SeparatesPartitions) {
  MetricsReadObserver first(range_for("metrics-split"));
  MetricsReadObserver second(PartitionRange{{"metrics-split", 3}, 0, 10});

  first.on_exhausted();
  second.on_exhausted();
  second.on_exhausted();

  auto *completed = counter("orr_ranges_completed_total");
  EXPECT_EQ(completed->get_value(labels_for("metrics-split")), 1u);
  EXPECT_EQ(completed->get_value({{"topic", "metrics-split"},
                                  {"partition", "3"}}),
            2u);
  EXPECT_EQ(completed->get_value(labels_for("never-read")), 0u);
}

TEST(MetricsReadObserverTest, ExposedAsJson) {
  MetricsReadObserver observer(range_for("metrics-json"));
  observer.on_batch(5);

  auto exposed = nlohmann::json::parse(MetricsManager::instance().expose_as_json());
  std::string text = exposed.dump();
  EXPECT_NE(text.find("orr_fetch_batches_total"), std::string::npos);
  EXPECT_NE(text.find("metrics-json"), std::string::npos);
}

TEST(MetricsReadObserverTest, ExposedAsPrometheusText) {
  MetricsReadObserver observer(range_for("metrics-text"));
  observer.on_retry(2);

  std::string text = MetricsManager::instance().expose_as_prometheus_text();
  EXPECT_NE(text.find("# TYPE orr_fetch_retries_total counter"),
            std::string::npos);
  EXPECT_NE(text.find("topic=\"metrics-text\""), std::string::npos);
}

TEST(MetricsManagerTest, RegisteringTwiceReturnsSameMetric) {
  auto &metrics = MetricsManager::instance();
  auto *first = metrics.register_labeled_counter("orr_test_counter", "a");
  auto *second = metrics.register_labeled_counter("orr_test_counter", "b");
  EXPECT_EQ(first, second);

  first->increment({{"k", "v"}}, 3);
  first->increment({{"k", "w"}});
  EXPECT_EQ(second->get_total(), 4u);
}

TEST(CompositeReadObserverTest, FansOutToEveryObserver) {
  auto a = std::make_shared<testing_support::RecordingObserver>();
  auto b = std::make_shared<testing_support::RecordingObserver>();
  CompositeReadObserver composite({a});
  composite.add(b);
  composite.add(nullptr);

  composite.on_retry(2);
  composite.on_empty_batch();
  composite.on_batch(9);
  composite.on_offset_gap(1, 4);
  composite.on_exhausted();

  for (const auto &observer : {a, b}) {
    ASSERT_EQ(observer->retries.size(), 1u);
    EXPECT_EQ(observer->retries[0], 2u);
    EXPECT_EQ(observer->empty_batches, 1);
    ASSERT_EQ(observer->batch_sizes.size(), 1u);
    EXPECT_EQ(observer->batch_sizes[0], 9u);
    ASSERT_EQ(observer->gaps.size(), 1u);
    EXPECT_EQ(observer->exhausted, 1);
  }
}

TEST(LoggingReadObserverTest, AcceptsEverySignal) {
  LoggingReadObserver observer(range_for("logging"));
  EXPECT_NO_THROW({
    observer.on_retry(2);
    observer.on_empty_batch();
    observer.on_batch(3);
    observer.on_offset_gap(3, 9);
    observer.on_exhausted();
  });
}

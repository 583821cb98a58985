#ifndef METRICS_READ_OBSERVER_HPP
#define METRICS_READ_OBSERVER_HPP

#include "core/metrics_manager.hpp"
#include "read_observer.hpp"

namespace range_reader {

// Feeds the reader signals into the process-wide MetricsManager, labelled
// with the topic and partition of the range.
class MetricsReadObserver : public IReadObserver {
public:
  explicit MetricsReadObserver(const PartitionRange &range);

  void on_retry(uint32_t attempt) override;
  void on_empty_batch() override;
  void on_batch(size_t record_count) override;
  void on_offset_gap(int64_t old_offset, int64_t new_offset) override;
  void on_exhausted() override;

private:
  MetricLabels labels_;

  LabeledCounter *retries_;
  LabeledCounter *empty_batches_;
  LabeledCounter *batches_;
  LabeledCounter *records_fetched_;
  LabeledCounter *offset_gaps_;
  LabeledCounter *skipped_offsets_;
  LabeledCounter *ranges_completed_;
};

} // namespace range_reader

#endif // METRICS_READ_OBSERVER_HPP

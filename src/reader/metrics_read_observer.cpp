#include "metrics_read_observer.hpp"

#include <string>

namespace range_reader {

MetricsReadObserver::MetricsReadObserver(const PartitionRange &range)
    : labels_{{"topic", range.topic_partition.topic},
              {"partition", std::to_string(range.topic_partition.partition)}} {
  auto &metrics = MetricsManager::instance();
  retries_ = metrics.register_labeled_counter(
      "orr_fetch_retries_total",
      "Polls repeated after a retriable client failure.");
  empty_batches_ = metrics.register_labeled_counter(
      "orr_fetch_empty_batches_total",
      "Polls that returned nothing while offsets were still pending.");
  batches_ = metrics.register_labeled_counter(
      "orr_fetch_batches_total", "Non-empty batches returned by a refill.");
  records_fetched_ = metrics.register_labeled_counter(
      "orr_fetch_records_total", "Records returned by refills.");
  offset_gaps_ = metrics.register_labeled_counter(
      "orr_offset_gaps_total",
      "Deliveries that advanced the offset by more than one.");
  skipped_offsets_ = metrics.register_labeled_counter(
      "orr_skipped_offsets_total",
      "Offsets inside the range that were never delivered.");
  ranges_completed_ = metrics.register_labeled_counter(
      "orr_ranges_completed_total", "Ranges read to their ending offset.");
}

void MetricsReadObserver::on_retry(uint32_t) { retries_->increment(labels_); }

void MetricsReadObserver::on_empty_batch() {
  empty_batches_->increment(labels_);
}

void MetricsReadObserver::on_batch(size_t record_count) {
  batches_->increment(labels_);
  records_fetched_->increment(labels_, record_count);
}

void MetricsReadObserver::on_offset_gap(int64_t old_offset,
                                        int64_t new_offset) {
  offset_gaps_->increment(labels_);
  if (new_offset - old_offset > 1)
    skipped_offsets_->increment(labels_,
                                static_cast<uint64_t>(new_offset - old_offset - 1));
}

void MetricsReadObserver::on_exhausted() {
  ranges_completed_->increment(labels_);
}

} // namespace range_reader

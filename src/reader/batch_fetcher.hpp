#ifndef BATCH_FETCHER_HPP
#define BATCH_FETCHER_HPP

#include "core/config.hpp"
#include "core/record.hpp"
#include "io/clients/base_partition_client.hpp"
#include "range_tracker.hpp"
#include "read_observer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace range_reader {

struct RetryPolicy {
  std::chrono::milliseconds poll_timeout{1000};
  uint32_t max_attempts = 5;

  static RetryPolicy from_config(const Config::ReaderConfig &config);
};

// Pulls records from the client one at a time, refilling its batch through
// a bounded poll loop once the current batch is drained.
//
// A refill polls at most max_attempts times and ends on the first non-empty
// batch, or on an empty batch once nothing is pending. Retriable failures
// are retried immediately; the max_attempts-th retriable failure raises
// RetriesExhaustedError. Empty batches while the tracker still expects data
// are re-polled without counting as failures. Reaching the poll ceiling
// without a batch or an exhausted failure count yields no record. A fatal
// failure raises FatalFetchError at once.
class BatchFetcher {
public:
  BatchFetcher(IPartitionClient &client, const RangeTracker &tracker,
               RetryPolicy policy, IReadObserver *observer = nullptr);

  std::optional<Record> next_record();

  // Records of the current batch not handed out yet.
  size_t buffered() const { return batch_.size() - position_; }

  const RetryPolicy &policy() const { return policy_; }

private:
  void refill();

  IPartitionClient &client_;
  const RangeTracker &tracker_;
  RetryPolicy policy_;
  IReadObserver *observer_;

  std::vector<Record> batch_;
  size_t position_ = 0;
};

} // namespace range_reader

#endif // BATCH_FETCHER_HPP

#include "batch_fetcher.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/scoped_timer.hpp"

#include <string>
#include <utility>

namespace range_reader {

RetryPolicy RetryPolicy::from_config(const Config::ReaderConfig &config) {
  RetryPolicy policy;
  policy.poll_timeout = std::chrono::milliseconds(config.poll_timeout_ms);
  policy.max_attempts = config.retry_attempts;
  return policy;
}

BatchFetcher::BatchFetcher(IPartitionClient &client,
                           const RangeTracker &tracker, RetryPolicy policy,
                           IReadObserver *observer)
    : client_(client), tracker_(tracker), policy_(policy),
      observer_(observer) {
  if (policy_.max_attempts == 0)
    policy_.max_attempts = 1;
}

std::optional<Record> BatchFetcher::next_record() {
  if (position_ >= batch_.size())
    refill();
  if (position_ >= batch_.size())
    return std::nullopt;
  return std::move(batch_[position_++]);
}

void BatchFetcher::refill() {
  static Histogram *poll_timer = MetricsManager::instance().register_histogram(
      "orr_poll_duration_seconds",
      "Latency of a single poll of the partition client.");

  std::vector<Record> records;
  uint32_t retriable_failures = 0;
  for (uint32_t poll = 1; poll <= policy_.max_attempts; ++poll) {
    PollResult result;
    {
      ScopedTimer timer(*poll_timer);
      result = client_.poll(policy_.poll_timeout);
    }

    if (result.status == PollResult::Status::FATAL_ERROR) {
      LOG(LogLevel::ERROR, LogComponent::READER_FETCH,
          "Non-retriable error pulling records: " << result.error);
      throw FatalFetchError("Non-retriable error pulling records: " +
                                result.error,
                            poll);
    }

    if (result.status == PollResult::Status::RETRIABLE_ERROR) {
      ++retriable_failures;
      if (retriable_failures >= policy_.max_attempts) {
        LOG(LogLevel::ERROR, LogComponent::READER_FETCH,
            "Error pulling records. Exceeded maximum number of attempts "
                << policy_.max_attempts << ": " << result.error);
        throw RetriesExhaustedError(
            "Exceeded maximum number of attempts (" +
                std::to_string(policy_.max_attempts) +
                ") pulling records: " + result.error,
            retriable_failures);
      }
      if (poll < policy_.max_attempts) {
        LOG(LogLevel::DEBUG, LogComponent::READER_FETCH,
            "Error pulling records: " << result.error
                                      << ". Retrying with attempt "
                                      << retriable_failures + 1);
        if (observer_)
          observer_->on_retry(retriable_failures + 1);
      }
      continue;
    }

    if (!result.empty()) {
      records = std::move(result.records);
      break;
    }

    // An empty batch only ends the refill once the range is done; otherwise
    // the source may simply not have caught up yet. It does not count as a
    // failure, but the re-poll stays under the same ceiling.
    if (!tracker_.has_pending_data())
      break;
    if (observer_)
      observer_->on_empty_batch();
  }

  if (records.empty()) {
    LOG(LogLevel::INFO, LogComponent::READER_FETCH,
        "No records retrieved therefore nothing to iterate over.");
  } else {
    LOG(LogLevel::DEBUG, LogComponent::READER_FETCH,
        "Retrieved " << records.size() << " records to iterate over.");
    if (observer_)
      observer_->on_batch(records.size());
  }

  batch_ = std::move(records);
  position_ = 0;
}

} // namespace range_reader

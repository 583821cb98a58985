#include "offset_range_reader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "logging_read_observer.hpp"
#include "metrics_read_observer.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace range_reader {

const char *reader_state_to_string(ReaderState state) {
  switch (state) {
  case ReaderState::UNINITIALIZED:
    return "UNINITIALIZED";
  case ReaderState::READY:
    return "READY";
  case ReaderState::EXHAUSTED:
    return "EXHAUSTED";
  case ReaderState::CLOSED:
    return "CLOSED";
  }
  return "UNKNOWN";
}

OffsetRangeReader::OffsetRangeReader(ClientFactory client_factory,
                                     std::shared_ptr<IReadObserver> observer)
    : client_factory_(std::move(client_factory)),
      observer_(std::move(observer)) {}

OffsetRangeReader::~OffsetRangeReader() { close(); }

void OffsetRangeReader::initialize(const InputSplit &split,
                                   const Config::AppConfig &config) {
  if (state_ != ReaderState::UNINITIALIZED)
    throw ReaderStateError(std::string("Cannot initialize a reader in state ") +
                           reader_state_to_string(state_));

  const auto *partition_split = dynamic_cast<const PartitionSplit *>(&split);
  if (!partition_split)
    throw InvalidSplitError(
        "InputSplit for RecordReader is not valid split type: " +
        split.describe());

  const PartitionRange &range = partition_split->range();
  if (range.starting_offset < 0 ||
      range.starting_offset > range.ending_offset)
    throw InvalidSplitError("Invalid offset range for split " +
                            split.describe());

  if (!client_factory_)
    throw ReaderError("No client factory configured for the reader");

  if (!observer_) {
    auto composite = std::make_shared<CompositeReadObserver>();
    composite->add(std::make_shared<LoggingReadObserver>(range));
    composite->add(std::make_shared<MetricsReadObserver>(range));
    observer_ = composite;
  }

  range_ = range;
  release_client();
  client_ = client_factory_(config.kafka_client);
  if (!client_)
    throw ReaderError("Client factory did not produce a client");

  try {
    client_->assign(range.topic_partition);
    if (client_->requires_assignment_priming()) {
      // Lets the assignment take effect; whatever it returns is discarded by
      // the seek below.
      PollResult primer = client_->poll(std::chrono::milliseconds(0));
      if (primer.status == PollResult::Status::FATAL_ERROR)
        throw FatalFetchError("Priming poll failed: " + primer.error, 1);
      if (primer.status == PollResult::Status::RETRIABLE_ERROR)
        LOG(LogLevel::WARN, LogComponent::READER_LIFECYCLE,
            "Priming poll for " << range.topic_partition
                                << " failed: " << primer.error);
    }
    client_->seek(range.topic_partition, range.starting_offset);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::READER_LIFECYCLE,
        "Failed to position " << range.topic_partition << " at offset "
                              << range.starting_offset << ": " << e.what());
    release_client();
    throw;
  }

  tracker_ = std::make_unique<RangeTracker>(
      range.starting_offset, range.ending_offset, observer_.get());
  fetcher_ = std::make_unique<BatchFetcher>(
      *client_, *tracker_, RetryPolicy::from_config(config.reader),
      observer_.get());
  state_ = ReaderState::READY;

  LOG(LogLevel::INFO, LogComponent::READER_LIFECYCLE,
      "Reading data from " << range.topic_partition << " between "
                           << range.starting_offset << " and "
                           << range.ending_offset);
}

bool OffsetRangeReader::next_key_value() {
  if (state_ == ReaderState::UNINITIALIZED || state_ == ReaderState::CLOSED)
    throw ReaderStateError(std::string("Cannot advance a reader in state ") +
                           reader_state_to_string(state_));

  current_.reset();
  if (state_ == ReaderState::EXHAUSTED)
    return false;

  // One refill per call keeps a call bounded by the retry policy even when
  // the source keeps redelivering offsets that were already handed out.
  bool refilled = false;
  while (tracker_->has_pending_data()) {
    if (fetcher_->buffered() == 0) {
      if (refilled) {
        LOG(LogLevel::WARN, LogComponent::READER_RANGE,
            "Retrieved only offsets at or below "
                << tracker_->current_offset() << ", polling again on the "
                << "next call.");
        return false;
      }
      refilled = true;
    }

    std::optional<Record> record = fetcher_->next_record();
    if (!record) {
      LOG(LogLevel::WARN, LogComponent::READER_RANGE,
          "Retrieved no record, last offset was "
              << tracker_->current_offset() << " and ending offset is "
              << tracker_->ending_offset());
      return false;
    }

    if (record->offset >= tracker_->ending_offset()) {
      LOG(LogLevel::WARN, LogComponent::READER_RANGE,
          "Retrieved offset " << record->offset
                              << " past the ending offset "
                              << tracker_->ending_offset()
                              << ", last delivered offset was "
                              << tracker_->current_offset());
      tracker_->mark_complete();
      break;
    }

    if (!tracker_->record_delivered(record->offset))
      continue;

    LOG(LogLevel::TRACE, LogComponent::READER_RANGE,
        "Retrieved record with offset " << record->offset);
    current_ = std::move(record);
    return true;
  }

  mark_exhausted();
  return false;
}

std::optional<std::string> OffsetRangeReader::current_key() const {
  return current_ ? current_->key : std::nullopt;
}

std::optional<std::string> OffsetRangeReader::current_value() const {
  return current_ ? current_->value : std::nullopt;
}

float OffsetRangeReader::progress() const {
  return tracker_ ? tracker_->progress_estimate() : 0.0f;
}

bool OffsetRangeReader::has_pending_data() const {
  return tracker_ && tracker_->has_pending_data();
}

int64_t OffsetRangeReader::current_offset() const {
  return tracker_ ? tracker_->current_offset()
                  : (range_ ? range_->starting_offset - 1 : -1);
}

void OffsetRangeReader::close() {
  if (state_ == ReaderState::CLOSED)
    return;

  LOG(LogLevel::DEBUG, LogComponent::READER_LIFECYCLE,
      "Closing the record reader.");
  state_ = ReaderState::CLOSED;
  current_.reset();
  fetcher_.reset();

  release_client();
}

void OffsetRangeReader::release_client() {
  if (!client_)
    return;

  std::unique_ptr<IPartitionClient> client = std::move(client_);
  try {
    if (!client->close())
      LOG(LogLevel::WARN, LogComponent::READER_LIFECYCLE,
          "Client did not release its connection cleanly.");
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::READER_LIFECYCLE,
        "Error while closing client: " << e.what());
  }
}

void OffsetRangeReader::mark_exhausted() {
  if (state_ != ReaderState::READY)
    return;
  state_ = ReaderState::EXHAUSTED;
  if (observer_)
    observer_->on_exhausted();
}

} // namespace range_reader

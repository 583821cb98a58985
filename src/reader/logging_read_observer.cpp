#include "logging_read_observer.hpp"
#include "core/logger.hpp"

namespace range_reader {

void LoggingReadObserver::on_retry(uint32_t attempt) {
  LOG(LogLevel::WARN, LogComponent::READER_FETCH,
      "Error pulling records from " << range_.topic_partition
                                    << ". Retrying with attempt " << attempt);
}

void LoggingReadObserver::on_empty_batch() {
  LOG(LogLevel::WARN, LogComponent::READER_FETCH,
      "No records retrieved from " << range_.topic_partition
                                   << " but offsets before "
                                   << range_.ending_offset
                                   << " are pending, polling again.");
}

void LoggingReadObserver::on_batch(size_t record_count) {
  LOG(LogLevel::DEBUG, LogComponent::READER_FETCH,
      "Retrieved " << record_count << " records from "
                   << range_.topic_partition << " to iterate over.");
}

void LoggingReadObserver::on_offset_gap(int64_t old_offset,
                                        int64_t new_offset) {
  LOG(LogLevel::WARN, LogComponent::READER_RANGE,
      "Offset increment on " << range_.topic_partition
                             << " was larger than one, old " << old_offset
                             << " new " << new_offset);
}

void LoggingReadObserver::on_exhausted() {
  LOG(LogLevel::INFO, LogComponent::READER_RANGE,
      "Finished reading " << range_.topic_partition << " ["
                          << range_.starting_offset << ", "
                          << range_.ending_offset << ")");
}

} // namespace range_reader

#ifndef OFFSET_RANGE_READER_HPP
#define OFFSET_RANGE_READER_HPP

#include "base_record_reader.hpp"
#include "batch_fetcher.hpp"
#include "core/record.hpp"
#include "io/clients/base_partition_client.hpp"
#include "range_tracker.hpp"
#include "read_observer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace range_reader {

enum class ReaderState { UNINITIALIZED, READY, EXHAUSTED, CLOSED };

const char *reader_state_to_string(ReaderState state);

// Reads [starting_offset, ending_offset) of a single partition.
//
// The partition is assigned manually for the lifetime of the reader, no
// consumer group is joined and nothing is committed. Records are handed out
// in offset order; offsets may have holes. A record is only ever exposed
// after its offset has been accepted by the range tracker, so the accessors
// never show a record whose delivery failed.
class OffsetRangeReader : public IRecordReader {
public:
  // When no observer is given, initialize() installs one that logs and
  // records metrics.
  explicit OffsetRangeReader(ClientFactory client_factory,
                             std::shared_ptr<IReadObserver> observer = nullptr);
  ~OffsetRangeReader() override;

  OffsetRangeReader(const OffsetRangeReader &) = delete;
  OffsetRangeReader &operator=(const OffsetRangeReader &) = delete;

  // Throws InvalidSplitError when split is not a well-formed PartitionSplit
  // and ReaderStateError when the reader was initialized or closed before.
  // Client failures during assignment propagate as ReaderError after the
  // client has been closed; the reader stays uninitialized.
  void initialize(const InputSplit &split,
                  const Config::AppConfig &config) override;

  // Throws FetchError when the client failed; the offset state is left as
  // it was before the call. Polls for at most one refill per call, so false
  // may also mean only already delivered offsets arrived.
  bool next_key_value() override;

  std::optional<std::string> current_key() const override;
  std::optional<std::string> current_value() const override;
  const std::optional<Record> &current_record() const { return current_; }

  float progress() const override;
  void close() override;

  ReaderState state() const { return state_; }
  bool has_pending_data() const;
  int64_t current_offset() const;

private:
  void mark_exhausted();
  // Closes and drops the client, if any. Never throws.
  void release_client();

  ClientFactory client_factory_;
  std::shared_ptr<IReadObserver> observer_;

  std::unique_ptr<IPartitionClient> client_;
  std::optional<PartitionRange> range_;
  std::unique_ptr<RangeTracker> tracker_;
  std::unique_ptr<BatchFetcher> fetcher_;

  std::optional<Record> current_;
  ReaderState state_ = ReaderState::UNINITIALIZED;
};

} // namespace range_reader

#endif // OFFSET_RANGE_READER_HPP

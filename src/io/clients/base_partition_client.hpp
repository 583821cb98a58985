#ifndef BASE_PARTITION_CLIENT_HPP
#define BASE_PARTITION_CLIENT_HPP

#include "core/config.hpp"
#include "core/record.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace range_reader {

// Outcome of one poll. Failures are values so the retry policy can decide on
// them without unwinding.
struct PollResult {
  enum class Status { BATCH, RETRIABLE_ERROR, FATAL_ERROR };

  Status status = Status::BATCH;
  std::vector<Record> records;
  std::string error;

  static PollResult batch(std::vector<Record> records) {
    PollResult result;
    result.records = std::move(records);
    return result;
  }

  static PollResult retriable(std::string error) {
    PollResult result;
    result.status = Status::RETRIABLE_ERROR;
    result.error = std::move(error);
    return result;
  }

  static PollResult fatal(std::string error) {
    PollResult result;
    result.status = Status::FATAL_ERROR;
    result.error = std::move(error);
    return result;
  }

  bool ok() const { return status == Status::BATCH; }
  bool empty() const { return records.empty(); }
};

// A connection to a partitioned log which is assigned to partitions
// explicitly, never through group membership.
class IPartitionClient {
public:
  virtual ~IPartitionClient() = default;

  // Takes exclusive ownership of the partition. Throws ReaderError when the
  // assignment is refused.
  virtual void assign(const TopicPartition &topic_partition) = 0;

  // Positions the next poll at offset. Throws ReaderError on failure.
  virtual void seek(const TopicPartition &topic_partition, int64_t offset) = 0;

  // Blocks for at most timeout and returns whatever arrived in that time,
  // possibly nothing.
  virtual PollResult poll(std::chrono::milliseconds timeout) = 0;

  // Releases the connection. Returns false when the release failed; the
  // client must not be used afterwards either way.
  virtual bool close() = 0;

  // True when a manual assignment only takes effect after a poll, so the
  // reader has to prime it with a zero-timeout poll before seeking.
  virtual bool requires_assignment_priming() const { return true; }
};

using ClientFactory = std::function<std::unique_ptr<IPartitionClient>(
    const Config::KafkaClientConfig &)>;

} // namespace range_reader

#endif // BASE_PARTITION_CLIENT_HPP

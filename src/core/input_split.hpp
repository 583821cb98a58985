#ifndef INPUT_SPLIT_HPP
#define INPUT_SPLIT_HPP

#include "record.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace range_reader {

// The bounded range one reader instance consumes. ending_offset is
// exclusive: one past the last offset that can ever be delivered.
struct PartitionRange {
  TopicPartition topic_partition;
  int64_t starting_offset = 0;
  int64_t ending_offset = 0;

  int64_t size() const { return ending_offset - starting_offset; }
};

// Unit of parallel work handed to a record reader by the job runtime.
class InputSplit {
public:
  virtual ~InputSplit() = default;

  virtual std::string describe() const = 0;
};

class PartitionSplit : public InputSplit {
public:
  PartitionSplit(TopicPartition topic_partition, int64_t starting_offset,
                 int64_t ending_offset)
      : range_{std::move(topic_partition), starting_offset, ending_offset} {}

  const PartitionRange &range() const { return range_; }
  const TopicPartition &topic_partition() const {
    return range_.topic_partition;
  }
  int64_t starting_offset() const { return range_.starting_offset; }
  int64_t ending_offset() const { return range_.ending_offset; }

  std::string describe() const override {
    return range_.topic_partition.topic + "-" +
           std::to_string(range_.topic_partition.partition) + " [" +
           std::to_string(range_.starting_offset) + ", " +
           std::to_string(range_.ending_offset) + ")";
  }

private:
  PartitionRange range_;
};

} // namespace range_reader

#endif // INPUT_SPLIT_HPP

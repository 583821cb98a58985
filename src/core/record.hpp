#ifndef RECORD_HPP
#define RECORD_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace range_reader {

struct TopicPartition {
  std::string topic;
  int32_t partition = 0;

  bool operator==(const TopicPartition &other) const {
    return partition == other.partition && topic == other.topic;
  }
  bool operator!=(const TopicPartition &other) const {
    return !(*this == other);
  }
};

inline std::ostream &operator<<(std::ostream &os, const TopicPartition &tp) {
  return os << tp.topic << "-" << tp.partition;
}

// A single record as delivered by the partition client. Key and value are
// absent when the log carries a null for them (e.g. tombstones).
struct Record {
  TopicPartition topic_partition;
  int64_t offset = -1;
  std::optional<std::string> key;
  std::optional<std::string> value;
  int64_t timestamp_ms = -1;
};

} // namespace range_reader

#endif // RECORD_HPP

#ifndef KAFKA_PARTITION_CLIENT_HPP
#define KAFKA_PARTITION_CLIENT_HPP

#include "base_partition_client.hpp"
#include "core/config.hpp"

#include <librdkafka/rdkafkacpp.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace range_reader {

// IPartitionClient backed by a librdkafka KafkaConsumer. The consumer never
// subscribes: partitions are assigned manually and offsets are never
// committed.
class KafkaPartitionClient : public IPartitionClient {
public:
  KafkaPartitionClient(const Config::KafkaClientConfig &config,
                       size_t max_batch_size);
  ~KafkaPartitionClient() override;

  KafkaPartitionClient(const KafkaPartitionClient &) = delete;
  KafkaPartitionClient &operator=(const KafkaPartitionClient &) = delete;

  void assign(const TopicPartition &topic_partition) override;
  void seek(const TopicPartition &topic_partition, int64_t offset) override;
  PollResult poll(std::chrono::milliseconds timeout) override;
  bool close() override;

  // librdkafka accepts the start offset as part of the assignment, which is
  // honoured without a preceding poll.
  bool requires_assignment_priming() const override { return false; }

  static bool is_retriable(RdKafka::ErrorCode code);

private:
  static Record to_record(const RdKafka::Message &message);

  std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
  std::optional<TopicPartition> assigned_;
  size_t max_batch_size_;
};

ClientFactory make_kafka_client_factory(size_t max_batch_size);

} // namespace range_reader

#endif // KAFKA_PARTITION_CLIENT_HPP

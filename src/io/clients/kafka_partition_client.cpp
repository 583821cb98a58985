#include "kafka_partition_client.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace range_reader {

namespace {

void set_property(RdKafka::Conf &conf, const std::string &name,
                  const std::string &value) {
  std::string errstr;
  if (conf.set(name, value, errstr) != RdKafka::Conf::CONF_OK)
    throw ReaderError("Invalid Kafka client property '" + name +
                      "': " + errstr);
}

} // namespace

KafkaPartitionClient::KafkaPartitionClient(
    const Config::KafkaClientConfig &config, size_t max_batch_size)
    : max_batch_size_(std::max<size_t>(max_batch_size, 1)) {
  std::unique_ptr<RdKafka::Conf> conf(
      RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));

  set_property(*conf, Config::Keys::KC_BOOTSTRAP_SERVERS,
               config.bootstrap_servers);
  set_property(*conf, Config::Keys::KC_GROUP_ID, config.group_id);
  set_property(*conf, "enable.auto.commit", "false");
  set_property(*conf, "enable.auto.offset.store", "false");
  for (const auto &[name, value] : config.properties)
    set_property(*conf, name, value);

  std::string errstr;
  consumer_.reset(RdKafka::KafkaConsumer::create(conf.get(), errstr));
  if (!consumer_)
    throw ReaderError("Failed to create Kafka consumer: " + errstr);

  LOG(LogLevel::INFO, LogComponent::IO_CLIENT,
      "Created Kafka consumer " << consumer_->name() << " for brokers "
                                << config.bootstrap_servers);
}

KafkaPartitionClient::~KafkaPartitionClient() {
  if (consumer_ && !close())
    LOG(LogLevel::WARN, LogComponent::IO_CLIENT,
        "Kafka consumer did not close cleanly during destruction.");
}

void KafkaPartitionClient::assign(const TopicPartition &topic_partition) {
  if (!consumer_)
    throw ReaderError("Cannot assign a closed Kafka client");

  // The assignment itself is handed to librdkafka by seek(), together with
  // the offset to start from.
  assigned_ = topic_partition;
  LOG(LogLevel::DEBUG, LogComponent::IO_CLIENT,
      "Assigned to " << topic_partition);
}

void KafkaPartitionClient::seek(const TopicPartition &topic_partition,
                                int64_t offset) {
  if (!consumer_)
    throw ReaderError("Cannot seek a closed Kafka client");
  if (!assigned_ || *assigned_ != topic_partition) {
    std::ostringstream oss;
    oss << "Cannot seek " << topic_partition << " which is not assigned";
    throw ReaderError(oss.str());
  }

  std::unique_ptr<RdKafka::TopicPartition> partition(
      RdKafka::TopicPartition::create(topic_partition.topic,
                                      topic_partition.partition, offset));
  std::vector<RdKafka::TopicPartition *> partitions{partition.get()};

  RdKafka::ErrorCode err = consumer_->assign(partitions);
  if (err != RdKafka::ERR_NO_ERROR) {
    std::ostringstream oss;
    oss << "Failed to assign " << topic_partition << " at offset " << offset
        << ": " << RdKafka::err2str(err);
    throw ReaderError(oss.str());
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_CLIENT,
      "Positioned " << topic_partition << " at offset " << offset);
}

PollResult KafkaPartitionClient::poll(std::chrono::milliseconds timeout) {
  if (!consumer_)
    return PollResult::fatal("Kafka client is closed");

  std::vector<Record> records;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (records.size() < max_batch_size_) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0)
      remaining = std::chrono::milliseconds(0);

    std::unique_ptr<RdKafka::Message> message(
        consumer_->consume(static_cast<int>(remaining.count())));

    const RdKafka::ErrorCode err = message->err();
    if (err == RdKafka::ERR_NO_ERROR) {
      records.push_back(to_record(*message));
    } else if (err == RdKafka::ERR__TIMED_OUT ||
               err == RdKafka::ERR__PARTITION_EOF) {
      break;
    } else if (!records.empty()) {
      // Hand out what already arrived; a persistent error shows up again on
      // the next poll.
      LOG(LogLevel::DEBUG, LogComponent::IO_CLIENT,
          "Deferring consumer error after " << records.size()
                                            << " records: "
                                            << message->errstr());
      break;
    } else if (is_retriable(err)) {
      return PollResult::retriable(message->errstr());
    } else {
      return PollResult::fatal(message->errstr());
    }

    if (remaining.count() == 0)
      break;
  }

  LOG(LogLevel::TRACE, LogComponent::IO_CLIENT,
      "Poll returned " << records.size() << " records");
  return PollResult::batch(std::move(records));
}

bool KafkaPartitionClient::close() {
  if (!consumer_)
    return true;

  RdKafka::ErrorCode err = consumer_->close();
  consumer_.reset();
  assigned_.reset();

  if (err != RdKafka::ERR_NO_ERROR) {
    LOG(LogLevel::WARN, LogComponent::IO_CLIENT,
        "Kafka consumer close reported: " << RdKafka::err2str(err));
    return false;
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_CLIENT, "Kafka consumer closed.");
  return true;
}

bool KafkaPartitionClient::is_retriable(RdKafka::ErrorCode code) {
  switch (code) {
  case RdKafka::ERR__TRANSPORT:
  case RdKafka::ERR__RESOLVE:
  case RdKafka::ERR__ALL_BROKERS_DOWN:
  case RdKafka::ERR__TIMED_OUT_QUEUE:
  case RdKafka::ERR_UNKNOWN_TOPIC_OR_PART:
  case RdKafka::ERR_LEADER_NOT_AVAILABLE:
  case RdKafka::ERR_NOT_LEADER_FOR_PARTITION:
  case RdKafka::ERR_REQUEST_TIMED_OUT:
  case RdKafka::ERR_BROKER_NOT_AVAILABLE:
  case RdKafka::ERR_REPLICA_NOT_AVAILABLE:
  case RdKafka::ERR_NETWORK_EXCEPTION:
  case RdKafka::ERR_NOT_ENOUGH_REPLICAS:
  case RdKafka::ERR_KAFKA_STORAGE_ERROR:
    return true;
  default:
    return false;
  }
}

Record KafkaPartitionClient::to_record(const RdKafka::Message &message) {
  Record record;
  record.topic_partition.topic = message.topic_name();
  record.topic_partition.partition = message.partition();
  record.offset = message.offset();
  record.timestamp_ms = message.timestamp().timestamp;

  if (const std::string *key = message.key())
    record.key = *key;
  if (message.payload())
    record.value.emplace(static_cast<const char *>(message.payload()),
                         message.len());
  return record;
}

ClientFactory make_kafka_client_factory(size_t max_batch_size) {
  return [max_batch_size](const Config::KafkaClientConfig &config)
             -> std::unique_ptr<IPartitionClient> {
    return std::make_unique<KafkaPartitionClient>(config, max_batch_size);
  };
}

} // namespace range_reader

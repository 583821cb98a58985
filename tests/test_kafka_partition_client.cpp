#include "core/errors.hpp"
#include "io/clients/kafka_partition_client.hpp"

#include <gtest/gtest.h>

#include <librdkafka/rdkafkacpp.h>

using range_reader::KafkaPartitionClient;

// --- Tests for error classification ---
TEST(KafkaPartitionClientTest, TransientErrorsAreRetriable) {
  EXPECT_TRUE(KafkaPartitionClient::is_retriable(RdKafka::ERR__TRANSPORT));
  EXPECT_TRUE(KafkaPartitionClient::is_retriable(RdKafka::ERR__RESOLVE));
  EXPECT_TRUE(
      KafkaPartitionClient::is_retriable(RdKafka::ERR__ALL_BROKERS_DOWN));
  EXPECT_TRUE(
      KafkaPartitionClient::is_retriable(RdKafka::ERR_REQUEST_TIMED_OUT));
  EXPECT_TRUE(
      KafkaPartitionClient::is_retriable(RdKafka::ERR_NETWORK_EXCEPTION));
}

TEST(KafkaPartitionClientTest, LeaderChangesAreRetriable) {
  EXPECT_TRUE(
      KafkaPartitionClient::is_retriable(RdKafka::ERR_LEADER_NOT_AVAILABLE));
  EXPECT_TRUE(KafkaPartitionClient::is_retriable(
      RdKafka::ERR_NOT_LEADER_FOR_PARTITION));
  EXPECT_TRUE(
      KafkaPartitionClient::is_retriable(RdKafka::ERR_BROKER_NOT_AVAILABLE));
}

TEST(KafkaPartitionClientTest, AuthorizationAndUnknownErrorsAreFatal) {
  EXPECT_FALSE(KafkaPartitionClient::is_retriable(
      RdKafka::ERR_TOPIC_AUTHORIZATION_FAILED));
  EXPECT_FALSE(KafkaPartitionClient::is_retriable(
      RdKafka::ERR_GROUP_AUTHORIZATION_FAILED));
  EXPECT_FALSE(KafkaPartitionClient::is_retriable(
      RdKafka::ERR_SASL_AUTHENTICATION_FAILED));
  EXPECT_FALSE(KafkaPartitionClient::is_retriable(RdKafka::ERR__AUTHENTICATION));
  EXPECT_FALSE(KafkaPartitionClient::is_retriable(RdKafka::ERR_UNKNOWN));
  EXPECT_FALSE(
      KafkaPartitionClient::is_retriable(RdKafka::ERR_OFFSET_OUT_OF_RANGE));
  EXPECT_FALSE(KafkaPartitionClient::is_retriable(RdKafka::ERR__FATAL));
}

// --- Tests for construction ---
TEST(KafkaPartitionClientTest, RejectsUnknownProperty) {
  Config::KafkaClientConfig config;
  config.properties["no.such.property"] = "1";
  EXPECT_THROW(KafkaPartitionClient(config, 100), range_reader::ReaderError);
}

#include "core/errors.hpp"
#include "fakes/scripted_partition_client.hpp"
#include "reader/batch_fetcher.hpp"
#include "reader/range_tracker.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <memory>
#include <optional>

using namespace range_reader;
using namespace testing_support;

namespace {

class BatchFetcherTest : public ::testing::Test {
protected:
  void SetUp() override { journal = std::make_shared<ClientJournal>(); }

  std::unique_ptr<ScriptedPartitionClient>
  make_client(std::deque<PollResult> script) {
    return std::make_unique<ScriptedPartitionClient>(std::move(script),
                                                     journal, false);
  }

  static RetryPolicy policy(uint32_t max_attempts) {
    RetryPolicy p;
    p.poll_timeout = std::chrono::milliseconds(250);
    p.max_attempts = max_attempts;
    return p;
  }

  std::shared_ptr<ClientJournal> journal;
  RecordingObserver observer;
};

} // namespace

TEST_F(BatchFetcherTest, RetriableFailuresAreTransparent) {
  auto client = make_client({PollResult::retriable("broker down"),
                             PollResult::retriable("broker down"),
                             batch_of({0, 1})});
  RangeTracker tracker(0, 10);
  BatchFetcher fetcher(*client, tracker, policy(3), &observer);

  auto record = fetcher.next_record();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->offset, 0);
  EXPECT_EQ(journal->poll_timeouts.size(), 3u);
  ASSERT_EQ(observer.retries.size(), 2u);
  EXPECT_EQ(observer.retries[0], 2u);
  EXPECT_EQ(observer.retries[1], 3u);
  ASSERT_EQ(observer.batch_sizes.size(), 1u);
  EXPECT_EQ(observer.batch_sizes[0], 2u);
}

TEST_F(BatchFetcherTest, ExhaustedRetriesThrowAndLeaveOffsetUnchanged) {
  auto client = make_client({PollResult::retriable("e1"),
                             PollResult::retriable("e2"),
                             PollResult::retriable("e3"), batch_of({0})});
  RangeTracker tracker(0, 10);
  BatchFetcher fetcher(*client, tracker, policy(3), &observer);

  try {
    fetcher.next_record();
    FAIL() << "Expected RetriesExhaustedError";
  } catch (const RetriesExhaustedError &e) {
    EXPECT_EQ(e.attempts(), 3u);
  }
  EXPECT_EQ(journal->poll_timeouts.size(), 3u);
  EXPECT_EQ(tracker.current_offset(), -1);
  EXPECT_EQ(fetcher.buffered(), 0u);
}

TEST_F(BatchFetcherTest, FatalFailureIsNotRetried) {
  auto client = make_client({PollResult::fatal("authorization failed"),
                             batch_of({0})});
  RangeTracker tracker(0, 10);
  BatchFetcher fetcher(*client, tracker, policy(5), &observer);

  try {
    fetcher.next_record();
    FAIL() << "Expected FatalFetchError";
  } catch (const FatalFetchError &e) {
    EXPECT_EQ(e.attempts(), 1u);
  }
  EXPECT_EQ(journal->poll_timeouts.size(), 1u);
  EXPECT_TRUE(observer.retries.empty());
}

TEST_F(BatchFetcherTest, FatalFailureAfterRetriesReportsAttempt) {
  auto client = make_client({PollResult::retriable("transient"),
                             PollResult::fatal("offset out of range")});
  RangeTracker tracker(0, 10);
  BatchFetcher fetcher(*client, tracker, policy(5));

  try {
    fetcher.next_record();
    FAIL() << "Expected FatalFetchError";
  } catch (const FatalFetchError &e) {
    EXPECT_EQ(e.attempts(), 2u);
  }
}

TEST_F(BatchFetcherTest, EmptyBatchIsPolledAgainWhileDataIsPending) {
  auto client = make_client({empty_batch(), batch_of({0, 1})});
  RangeTracker tracker(0, 5);
  BatchFetcher fetcher(*client, tracker, policy(3), &observer);

  auto record = fetcher.next_record();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->offset, 0);
  EXPECT_EQ(observer.empty_batches, 1);
  EXPECT_EQ(journal->poll_timeouts.size(), 2u);
}

TEST_F(BatchFetcherTest, AllEmptyAttemptsYieldNoRecord) {
  auto client = make_client({});
  RangeTracker tracker(0, 5);
  BatchFetcher fetcher(*client, tracker, policy(3), &observer);

  EXPECT_FALSE(fetcher.next_record().has_value());
  EXPECT_EQ(journal->poll_timeouts.size(), 3u);
  EXPECT_EQ(observer.empty_batches, 3);
  EXPECT_TRUE(observer.batch_sizes.empty());
  EXPECT_TRUE(tracker.has_pending_data());
}

TEST_F(BatchFetcherTest, EmptyBatchesDoNotCountAsFailures) {
  auto client = make_client({empty_batch(), empty_batch(),
                             PollResult::retriable("one transient error"),
                             batch_of({0})});
  RangeTracker tracker(0, 5);
  BatchFetcher fetcher(*client, tracker, policy(3), &observer);

  std::optional<Record> record;
  EXPECT_NO_THROW(record = fetcher.next_record());
  EXPECT_FALSE(record.has_value());
  EXPECT_EQ(journal->poll_timeouts.size(), 3u);
  EXPECT_EQ(observer.empty_batches, 2);
  EXPECT_TRUE(tracker.has_pending_data());

  // The next refill starts with a fresh failure count.
  record = fetcher.next_record();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->offset, 0);
}

TEST_F(BatchFetcherTest, EmptyBatchEndsRefillWhenNothingIsPending) {
  auto client = make_client({});
  RangeTracker tracker(7, 7);
  BatchFetcher fetcher(*client, tracker, policy(3), &observer);

  EXPECT_FALSE(fetcher.next_record().has_value());
  EXPECT_EQ(journal->poll_timeouts.size(), 1u);
  EXPECT_EQ(observer.empty_batches, 0);
}

TEST_F(BatchFetcherTest, BufferedRecordsAreServedWithoutPolling) {
  auto client = make_client({batch_of({10, 11, 12})});
  RangeTracker tracker(10, 20);
  BatchFetcher fetcher(*client, tracker, policy(3));

  ASSERT_EQ(fetcher.next_record()->offset, 10);
  EXPECT_EQ(fetcher.buffered(), 2u);
  ASSERT_EQ(fetcher.next_record()->offset, 11);
  ASSERT_EQ(fetcher.next_record()->offset, 12);
  EXPECT_EQ(fetcher.buffered(), 0u);
  EXPECT_EQ(journal->poll_timeouts.size(), 1u);
}

TEST_F(BatchFetcherTest, PollsWithConfiguredTimeout) {
  auto client = make_client({PollResult::retriable("x"), batch_of({0})});
  RangeTracker tracker(0, 1);
  BatchFetcher fetcher(*client, tracker, policy(2));

  ASSERT_TRUE(fetcher.next_record().has_value());
  for (const auto &timeout : journal->poll_timeouts)
    EXPECT_EQ(timeout, std::chrono::milliseconds(250));
}

TEST_F(BatchFetcherTest, ZeroAttemptsStillPollsOnce) {
  auto client = make_client({batch_of({0})});
  RangeTracker tracker(0, 1);
  BatchFetcher fetcher(*client, tracker, policy(0));

  EXPECT_EQ(fetcher.policy().max_attempts, 1u);
  EXPECT_TRUE(fetcher.next_record().has_value());
}

TEST(RetryPolicyTest, FromReaderConfig) {
  Config::ReaderConfig config;
  config.poll_timeout_ms = 1500;
  config.retry_attempts = 7;

  RetryPolicy policy = RetryPolicy::from_config(config);
  EXPECT_EQ(policy.poll_timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(policy.max_attempts, 7u);
}

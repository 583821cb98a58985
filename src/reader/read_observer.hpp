#ifndef READ_OBSERVER_HPP
#define READ_OBSERVER_HPP

#include "core/input_split.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace range_reader {

// Advisory signals raised while a range is read. None of them changes how
// the reader behaves; implementations must not throw.
class IReadObserver {
public:
  virtual ~IReadObserver() = default;

  // A refill is about to poll again after a retriable failure. attempt is
  // the 1-based number of the poll that is about to run.
  virtual void on_retry(uint32_t attempt) { (void)attempt; }

  // A poll returned nothing although offsets of the range are still pending.
  virtual void on_empty_batch() {}

  // A refill produced a non-empty batch.
  virtual void on_batch(size_t record_count) { (void)record_count; }

  // Delivered offsets skipped positions (compaction, transaction markers).
  virtual void on_offset_gap(int64_t old_offset, int64_t new_offset) {
    (void)old_offset;
    (void)new_offset;
  }

  // The range has no pending offsets left.
  virtual void on_exhausted() {}
};

class CompositeReadObserver : public IReadObserver {
public:
  CompositeReadObserver() = default;
  explicit CompositeReadObserver(
      std::vector<std::shared_ptr<IReadObserver>> observers)
      : observers_(std::move(observers)) {}

  void add(std::shared_ptr<IReadObserver> observer) {
    if (observer)
      observers_.push_back(std::move(observer));
  }

  void on_retry(uint32_t attempt) override {
    for (auto &observer : observers_)
      observer->on_retry(attempt);
  }

  void on_empty_batch() override {
    for (auto &observer : observers_)
      observer->on_empty_batch();
  }

  void on_batch(size_t record_count) override {
    for (auto &observer : observers_)
      observer->on_batch(record_count);
  }

  void on_offset_gap(int64_t old_offset, int64_t new_offset) override {
    for (auto &observer : observers_)
      observer->on_offset_gap(old_offset, new_offset);
  }

  void on_exhausted() override {
    for (auto &observer : observers_)
      observer->on_exhausted();
  }

private:
  std::vector<std::shared_ptr<IReadObserver>> observers_;
};

} // namespace range_reader

#endif // READ_OBSERVER_HPP

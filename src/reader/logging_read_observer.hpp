#ifndef LOGGING_READ_OBSERVER_HPP
#define LOGGING_READ_OBSERVER_HPP

#include "read_observer.hpp"

namespace range_reader {

class LoggingReadObserver : public IReadObserver {
public:
  explicit LoggingReadObserver(PartitionRange range) : range_(std::move(range)) {}

  void on_retry(uint32_t attempt) override;
  void on_empty_batch() override;
  void on_batch(size_t record_count) override;
  void on_offset_gap(int64_t old_offset, int64_t new_offset) override;
  void on_exhausted() override;

private:
  PartitionRange range_;
};

} // namespace range_reader

#endif // LOGGING_READ_OBSERVER_HPP

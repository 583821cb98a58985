#include "range_tracker.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace range_reader {

RangeTracker::RangeTracker(int64_t starting_offset, int64_t ending_offset,
                           IReadObserver *observer)
    : starting_offset_(starting_offset), ending_offset_(ending_offset),
      current_offset_(starting_offset - 1), observer_(observer) {
  if (starting_offset > ending_offset)
    throw std::invalid_argument(
        "starting offset " + std::to_string(starting_offset) +
        " is beyond ending offset " + std::to_string(ending_offset));
}

bool RangeTracker::record_delivered(int64_t offset) {
  if (offset <= current_offset_) {
    LOG(LogLevel::DEBUG, LogComponent::READER_RANGE,
        "Ignoring offset " << offset << " which does not advance current offset "
                           << current_offset_);
    return false;
  }

  const int64_t old_offset = current_offset_;
  current_offset_ = offset;
  LOG(LogLevel::TRACE, LogComponent::READER_RANGE,
      "Current offset updated to " << current_offset_);

  if (current_offset_ - old_offset > 1 && observer_)
    observer_->on_offset_gap(old_offset, current_offset_);
  return true;
}

void RangeTracker::mark_complete() {
  current_offset_ = std::max(current_offset_, ending_offset_ - 1);
}

float RangeTracker::progress_estimate() const {
  const int64_t size = ending_offset_ - starting_offset_;
  if (size <= 0)
    return 1.0f;

  const double consumed =
      static_cast<double>(current_offset_ - starting_offset_ + 1);
  return static_cast<float>(std::clamp(consumed / size, 0.0, 1.0));
}

} // namespace range_reader

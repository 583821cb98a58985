#ifndef RANGE_TRACKER_HPP
#define RANGE_TRACKER_HPP

#include "read_observer.hpp"

#include <cstdint>

namespace range_reader {

// Offset bookkeeping for one [starting_offset, ending_offset) range.
//
// current_offset starts one below the range ("nothing consumed") and only
// ever moves forward. Offsets are not required to be dense: compacted and
// transactional logs leave holes that are reported as gaps.
class RangeTracker {
public:
  RangeTracker(int64_t starting_offset, int64_t ending_offset,
               IReadObserver *observer = nullptr);

  // ending_offset is one past the last offset that can appear, so the last
  // deliverable offset is ending_offset - 1.
  bool has_pending_data() const { return current_offset_ < ending_offset_ - 1; }

  // Records the offset of a delivered record. Offsets that would move the
  // cursor backwards (or keep it in place) are refused and return false.
  bool record_delivered(int64_t offset);

  // Declares the range finished although its tail was never delivered.
  void mark_complete();

  // Fraction of the range consumed, in [0, 1]. Assumes dense offsets, so it
  // overestimates in the presence of gaps. An empty range reports 1.
  float progress_estimate() const;

  int64_t starting_offset() const { return starting_offset_; }
  int64_t ending_offset() const { return ending_offset_; }
  int64_t current_offset() const { return current_offset_; }

private:
  const int64_t starting_offset_;
  const int64_t ending_offset_;
  int64_t current_offset_;
  IReadObserver *observer_;
};

} // namespace range_reader

#endif // RANGE_TRACKER_HPP

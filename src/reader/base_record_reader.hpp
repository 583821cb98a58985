#ifndef BASE_RECORD_READER_HPP
#define BASE_RECORD_READER_HPP

#include "core/config.hpp"
#include "core/input_split.hpp"

#include <optional>
#include <string>

namespace range_reader {

// Pull contract a batch job uses to drain one split.
class IRecordReader {
public:
  virtual ~IRecordReader() = default;

  virtual void initialize(const InputSplit &split,
                          const Config::AppConfig &config) = 0;

  // Moves to the next record. Returns false when no record is available for
  // this call; the current record is cleared in that case.
  virtual bool next_key_value() = 0;

  virtual std::optional<std::string> current_key() const = 0;
  virtual std::optional<std::string> current_value() const = 0;

  virtual float progress() const = 0;

  // Releases every resource held by the reader. Must be idempotent and must
  // not throw.
  virtual void close() = 0;
};

// Closes a reader on every exit path of the enclosing scope.
class ReaderCloseGuard {
public:
  explicit ReaderCloseGuard(IRecordReader &reader) : reader_(reader) {}
  ~ReaderCloseGuard() { reader_.close(); }

  ReaderCloseGuard(const ReaderCloseGuard &) = delete;
  ReaderCloseGuard &operator=(const ReaderCloseGuard &) = delete;

private:
  IRecordReader &reader_;
};

} // namespace range_reader

#endif // BASE_RECORD_READER_HPP

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace range_reader {

// Base of every error raised by a reader. Callers are expected to abort the
// unit of work that owns the reader when one of these escapes.
class ReaderError : public std::runtime_error {
public:
  explicit ReaderError(const std::string &message)
      : std::runtime_error(message) {}
};

// The split handed to initialize() is not a partition range.
class InvalidSplitError : public ReaderError {
public:
  explicit InvalidSplitError(const std::string &message)
      : ReaderError(message) {}
};

// An operation was called in a lifecycle state that does not allow it.
class ReaderStateError : public ReaderError {
public:
  explicit ReaderStateError(const std::string &message)
      : ReaderError(message) {}
};

class FetchError : public ReaderError {
public:
  FetchError(const std::string &message, uint32_t attempts)
      : ReaderError(message), attempts_(attempts) {}

  uint32_t attempts() const noexcept { return attempts_; }

private:
  uint32_t attempts_;
};

// Every poll of a refill failed with an error the client classified as
// retriable.
class RetriesExhaustedError : public FetchError {
public:
  using FetchError::FetchError;
};

// The client reported an error it does not consider retriable.
class FatalFetchError : public FetchError {
public:
  using FetchError::FetchError;
};

} // namespace range_reader

#endif // ERRORS_HPP

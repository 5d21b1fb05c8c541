#pragma once

#include <stdexcept>
#include <string>

namespace bibmirror::util {

/*
  Central error types.

  The ingestion orchestrator translates these into terminal results;
  none of them escapes past it.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Structural damage in a dump stream (unterminated definition or row).
class DumpCorrupted : public std::runtime_error {
 public:
  explicit DumpCorrupted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Remote delta endpoint failure. Never used for cancellation.
class FetchFailed : public std::runtime_error {
 public:
  explicit FetchFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace bibmirror::util

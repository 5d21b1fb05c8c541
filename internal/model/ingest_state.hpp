#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bibmirror::model {

/*
  Terminal states shared by bulk import and synchronization.

  Callers receive exactly one of these per operation; no other side
  channel reports failure.
*/
enum class IngestStatus : std::uint8_t {
  kCompleted    = 1,
  kCancelled    = 2,
  kDataNotFound = 3,
  kLowDiskSpace = 4,
  kError        = 5,
};

// Detail for kError.
enum class ErrorKind : std::uint8_t {
  kNone = 0,
  kWrongTable,
  kCorruptedDump,
  kNetwork,
  kStorage,
  kEmptyFamily,
  kNotConfigured,
  kIo,
  kInternal,
};

constexpr std::string_view ToString(IngestStatus status) {
  switch (status) {
    case IngestStatus::kCompleted:
      return "completed";
    case IngestStatus::kCancelled:
      return "cancelled";
    case IngestStatus::kDataNotFound:
      return "data-not-found";
    case IngestStatus::kLowDiskSpace:
      return "low-disk-space";
    case IngestStatus::kError:
      return "error";
  }
  return "unknown";
}

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kWrongTable:
      return "wrong-table";
    case ErrorKind::kCorruptedDump:
      return "corrupted-dump";
    case ErrorKind::kNetwork:
      return "network";
    case ErrorKind::kStorage:
      return "storage";
    case ErrorKind::kEmptyFamily:
      return "empty-family";
    case ErrorKind::kNotConfigured:
      return "not-configured";
    case ErrorKind::kIo:
      return "io";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "unknown";
}

struct IngestResult {
  IngestStatus  status = IngestStatus::kCompleted;
  ErrorKind     error  = ErrorKind::kNone;
  std::string   message;
  std::uint64_t added   = 0;
  std::uint64_t updated = 0;

  static IngestResult Terminal(IngestStatus status, std::uint64_t added = 0, std::uint64_t updated = 0) {
    IngestResult result;
    result.status  = status;
    result.added   = added;
    result.updated = updated;
    return result;
  }

  static IngestResult Failed(ErrorKind kind, std::string message) {
    IngestResult result;
    result.status  = IngestStatus::kError;
    result.error   = kind;
    result.message = std::move(message);
    return result;
  }
};

} // namespace bibmirror::model

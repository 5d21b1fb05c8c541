#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace bibmirror::ingest {

/*
  Free-space query for the volume holding the catalog.
*/
class DiskSpaceProbe {
 public:
  virtual ~DiskSpaceProbe() = default;

  // nullopt when the volume cannot be queried.
  virtual std::optional<uint64_t> FreeBytes() = 0;
};

class FilesystemDiskSpaceProbe final : public DiskSpaceProbe {
 public:
  // path may be the database file or its directory
  explicit FilesystemDiskSpaceProbe(std::filesystem::path path);

  std::optional<uint64_t> FreeBytes() override;

 private:
  std::filesystem::path path_;
};

// An unknown reading never counts as low.
inline bool IsLowDiskSpace(const std::optional<uint64_t>& free_bytes, uint64_t threshold) {
  return free_bytes && *free_bytes < threshold;
}

} // namespace bibmirror::ingest

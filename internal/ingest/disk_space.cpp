#include "internal/ingest/disk_space.hpp"

#include "internal/observability/logging.hpp"

namespace bibmirror::ingest {

FilesystemDiskSpaceProbe::FilesystemDiskSpaceProbe(std::filesystem::path path) : path_(std::move(path)) {
}

std::optional<uint64_t> FilesystemDiskSpaceProbe::FreeBytes() {
  std::error_code ec;

  auto target = path_;
  if (!std::filesystem::is_directory(target, ec)) {
    target = target.has_parent_path() ? target.parent_path() : std::filesystem::current_path(ec);
  }

  const auto info = std::filesystem::space(target, ec);
  if (ec) {
    BIBMIRROR_LOG_WARN("disk space query failed",
                       {observability::StringField("path", target.string()), observability::StringField("error", ec.message())});
    return std::nullopt;
  }
  return static_cast<uint64_t>(info.available);
}

} // namespace bibmirror::ingest

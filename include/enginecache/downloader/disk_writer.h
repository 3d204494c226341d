#pragma once

#include <enginecache/core/types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>

namespace enginecache::downloader {

/**
 * Sequential writer for a staging file.
 *
 * The file is created with owner-only permissions. Nothing is removed automatically; callers
 * decide whether to keep (commit) or discard() the file.
 */
class DiskWriter {
public:
    DiskWriter() = default;
    ~DiskWriter();

    DiskWriter(const DiskWriter&) = delete;
    DiskWriter& operator=(const DiskWriter&) = delete;

    Result<void> open(const std::filesystem::path& stagingFile);
    Result<void> write(std::span<const std::byte> data);

    /// Flush, fsync the file and its directory, then close.
    Result<void> finish();

    /// Close (if open) and remove the staging file. Never throws.
    void discard() noexcept;

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return written_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    std::uint64_t written_{0};
};

// ---------- Filesystem helpers shared with the local store ----------

Result<void> fsyncFile(const std::filesystem::path& p);
Result<void> fsyncDir(const std::filesystem::path& dir);

/// Create a directory tree and restrict the leaf to the owner (best-effort perms).
Result<void> ensurePrivateDir(const std::filesystem::path& dir);

/// Rename src over dst. Cross-device renames are refused (IOError) rather than copied.
Result<void> renameAtomic(const std::filesystem::path& src, const std::filesystem::path& dst);

/// Recursively remove a path. Missing paths are not an error.
Result<void> removeTree(const std::filesystem::path& p);

/// Sum of regular file sizes below a directory (best-effort).
std::uint64_t directorySize(const std::filesystem::path& dir) noexcept;

} // namespace enginecache::downloader

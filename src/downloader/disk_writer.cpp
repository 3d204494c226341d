/*
 * Staging-file writer and filesystem helpers.
 *
 * - Staging files live under the store root so the final move is a same-filesystem rename
 * - Restrictive permissions for staging (0600 files, 0700 dirs) on POSIX
 * - fsync of file and containing directory before anything is made visible
 */

#include <enginecache/downloader/disk_writer.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace enginecache::downloader {

namespace fs = std::filesystem;

namespace {

ErrorCode errorCodeFor(const std::error_code& ec) {
    if (ec == std::errc::no_space_on_device)
        return ErrorCode::StorageFull;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        return ErrorCode::PermissionDenied;
    return ErrorCode::IOError;
}

void ensure_file_private(const fs::path& p) {
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::debug("Failed to set private file perms on {}: {}", p.string(), ec.message());
    }
}

} // namespace

Result<void> fsyncFile(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IOError, "open() failed for fsync: " + p.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IOError, "fsync() failed for: " + p.string()};
    }
#endif
    ::close(fd);
    return {};
}

Result<void> fsyncDir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IOError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IOError, "fsync(dir) failed for: " + dir.string()};
    }
#endif
    ::close(fd);
    return {};
}

Result<void> ensurePrivateDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{errorCodeFor(ec),
                     "Failed to create directory " + dir.string() + ": " + ec.message()};
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions for dir {}: {}", dir.string(), ec.message());
    }
    return {};
}

Result<void> renameAtomic(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec) {
        return {};
    }
    if (ec == std::errc::cross_device_link) {
        return Error{ErrorCode::IOError, "Staging area and destination are on different "
                                         "filesystems: " +
                                             src.string() + " -> " + dst.string()};
    }
    return Error{errorCodeFor(ec), "rename() failed (" + ec.message() + ") from " + src.string() +
                                       " to " + dst.string()};
}

Result<void> removeTree(const fs::path& p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{errorCodeFor(ec), "Failed to remove " + p.string() + ": " + ec.message()};
    }
    return {};
}

std::uint64_t directorySize(const fs::path& dir) noexcept {
    std::uint64_t total = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fe;
        if (it->is_regular_file(fe) && !fe) {
            auto sz = it->file_size(fe);
            if (!fe)
                total += static_cast<std::uint64_t>(sz);
        }
    }
    return total;
}

// ---------- DiskWriter ----------

DiskWriter::~DiskWriter() {
    if (out_.is_open()) {
        out_.close();
    }
}

Result<void> DiskWriter::open(const fs::path& stagingFile) {
    if (out_.is_open()) {
        return Error{ErrorCode::InvalidState, "DiskWriter already open: " + path_.string()};
    }
    auto dirRes = ensurePrivateDir(stagingFile.parent_path());
    if (!dirRes) {
        return dirRes;
    }
    path_ = stagingFile;
    written_ = 0;
    out_.open(stagingFile, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out_.good()) {
        return Error{ErrorCode::IOError, "Failed to create staging file: " + stagingFile.string()};
    }
    ensure_file_private(stagingFile);
    return {};
}

Result<void> DiskWriter::write(std::span<const std::byte> data) {
    if (!out_.is_open()) {
        return Error{ErrorCode::InvalidState, "DiskWriter is not open"};
    }
    if (data.empty()) {
        return {};
    }
    out_.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!out_.good()) {
        return Error{ErrorCode::IOError, "write failed on: " + path_.string()};
    }
    written_ += static_cast<std::uint64_t>(data.size());
    return {};
}

Result<void> DiskWriter::finish() {
    if (!out_.is_open()) {
        return Error{ErrorCode::InvalidState, "DiskWriter is not open"};
    }
    out_.flush();
    const bool ok = out_.good();
    out_.close();
    if (!ok) {
        return Error{ErrorCode::IOError, "flush failed on: " + path_.string()};
    }
    auto r = fsyncFile(path_);
    if (!r) {
        return r;
    }
    return fsyncDir(path_.parent_path());
}

void DiskWriter::discard() noexcept {
    if (out_.is_open()) {
        out_.close();
    }
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::debug("cleanup: failed to remove staging file {}: {}", path_.string(),
                      ec.message());
    }
}

} // namespace enginecache::downloader

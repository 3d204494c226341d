#pragma once

#include <enginecache/core/clock.h>
#include <enginecache/core/types.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace enginecache::store {

/**
 * A fully verified engine package on disk.
 */
struct EngineInstallation {
    EngineVersion version;
    std::filesystem::path installPath; // <root>/<version>
    std::string signature;             // as listed in the manifest
    TimePoint installedAt{};
    TimePoint lastUsedAt{};
    std::uint64_t sizeBytes{0};
    std::string packageFile; // file name inside installPath

    [[nodiscard]] std::filesystem::path packagePath() const { return installPath / packageFile; }
};

struct LocalStoreConfig {
    std::filesystem::path root;
    std::string packageFileName{"engine.zip"};
};

/// Reject versions that cannot name a directory below the store root.
Result<void> validateVersion(std::string_view version);

/// Read the sidecar record of an installation directory.
Result<EngineInstallation> loadSidecar(const std::filesystem::path& dir,
                                       const std::string& defaultPackageName);

/**
 * Directory of installed engine versions.
 *
 * Layout:
 *   <root>/<version>/<package>            installed package
 *   <root>/<version>/.enginecache.json    sidecar record
 *   <root>/.staging/<version>.<unique>/   in-progress installs
 *   <root>/.lock                          held (flock) by every open store
 *
 * The in-memory index is rebuilt from sidecars by open(). All methods are thread-safe; the
 * index mutex is never held across a package download. Staging leftovers are reaped only by
 * a store that finds no other store holding the root open.
 */
class LocalStore {
public:
    static constexpr const char* kSidecarName = ".enginecache.json";
    static constexpr const char* kStagingDirName = ".staging";
    static constexpr const char* kLockFileName = ".lock";
    static constexpr int kFormatVersion = 1;

    LocalStore(LocalStoreConfig config, std::shared_ptr<IClock> clock);
    ~LocalStore();

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    /// Create the root if needed, lock it shared, load sidecars and remove orphaned directories.
    Result<void> open();

    [[nodiscard]] bool has(const EngineVersion& version) const;

    /// Installation directory of a version; refreshes its last-used time.
    Result<std::filesystem::path> getPath(const EngineVersion& version);
    Result<std::string> getSignature(const EngineVersion& version) const;
    Result<EngineInstallation> get(const EngineVersion& version) const;

    /// Snapshot of all installations ordered by version.
    [[nodiscard]] std::vector<EngineInstallation> list() const;
    [[nodiscard]] std::size_t size() const;

    /// Create a fresh staging directory for one install attempt.
    Result<std::filesystem::path> stagingPath(const EngineVersion& version);

    /// Remove a staging directory left by a failed attempt.
    void discardStaging(const std::filesystem::path& stagingDir) noexcept;

    /**
     * Publish a staging directory containing the verified package as the installation of
     * `version`. On failure the index is unchanged and no partial slot remains.
     */
    Result<EngineInstallation> commit(const EngineVersion& version,
                                      const std::filesystem::path& stagingDir,
                                      std::string_view signature);

    Result<void> touch(const EngineVersion& version);

    /// Delete an installation. Returns the bytes freed; missing versions free zero.
    Result<std::uint64_t> remove(const EngineVersion& version);
    Result<void> removeAll();

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return config_.root; }
    [[nodiscard]] const std::string& packageFileName() const noexcept {
        return config_.packageFileName;
    }
    [[nodiscard]] std::filesystem::path stagingRoot() const {
        return config_.root / kStagingDirName;
    }

private:
    Result<void> writeSidecar(const EngineInstallation& inst,
                              const std::filesystem::path& dir) const;
    // True when no other store holds the root; the lock is left shared either way.
    bool lockRoot();
    void unlockRoot() noexcept;

    LocalStoreConfig config_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    std::map<EngineVersion, EngineInstallation> index_;
    std::uint64_t stagingCounter_{0};
    int lockFd_{-1};
};

} // namespace enginecache::store

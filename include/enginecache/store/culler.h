#pragma once

#include <enginecache/core/clock.h>
#include <enginecache/core/types.h>
#include <enginecache/store/local_store.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace enginecache::store {

// Retention policy; an empty policy removes nothing
struct CullPolicy {
    std::optional<std::size_t> maxInstallations;
    std::optional<std::chrono::seconds> maxAge;

    [[nodiscard]] bool empty() const noexcept { return !maxInstallations && !maxAge; }
};

struct CullOptions {
    CullPolicy policy;
    bool dryRun = false; // If true, only report what would be removed
    std::function<void(const EngineInstallation&)> onRemoved;
};

struct CullStats {
    std::size_t scanned = 0;
    std::size_t removed = 0;
    std::size_t skipped = 0; // pinned, busy or used since the scan
    std::uint64_t bytesReclaimed = 0;
    std::chrono::milliseconds duration{0};
    std::vector<EngineVersion> removedVersions;
    std::vector<std::string> errors;
};

/**
 * Held while one version is removed: the version's install lock and, when the owner tracks
 * pins, the pin registry lock taken after confirming the version is unpinned.
 */
struct RemovalLease {
    std::shared_ptr<std::mutex> versionMutex;
    std::unique_lock<std::mutex> versionLock;
    std::unique_lock<std::mutex> pinLock;
};

/**
 * Exclusive access to one version for the duration of its removal. Returns nullopt when the
 * version is busy (an install is in flight) or was pinned after the scan and must be skipped.
 */
using VersionGate = std::function<std::optional<RemovalLease>(const EngineVersion&)>;

using PinProvider = std::function<std::set<EngineVersion>()>;

/**
 * Applies a retention policy to a LocalStore.
 *
 * Candidates are installed versions that are neither pinned nor busy, oldest lastUsedAt
 * first. Every candidate unused for longer than maxAge goes; then the oldest candidates go
 * until at most maxInstallations unpinned installations remain. Each candidate is re-read
 * under its lease and skipped if it was used since the scan.
 */
class Culler {
public:
    Culler(LocalStore& store, std::shared_ptr<IClock> clock, VersionGate gate = {});
    ~Culler();

    Culler(const Culler&) = delete;
    Culler& operator=(const Culler&) = delete;

    Result<CullStats> cullMaybe(const std::set<EngineVersion>& pinned, const CullOptions& options);

    // Run cullMaybe on a background thread every `interval` until stopped
    void scheduleCulling(std::chrono::seconds interval, CullOptions options, PinProvider pins);
    void stopScheduledCulling();

    bool isCulling() const;
    CullStats getLastStats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace enginecache::store

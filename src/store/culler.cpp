#include <enginecache/store/culler.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <thread>

namespace enginecache::store {

struct Culler::Impl {
    LocalStore& store;
    std::shared_ptr<IClock> clock;
    VersionGate gate;

    // Scheduling state
    std::thread schedulerThread;
    std::condition_variable schedulerCv;
    std::mutex schedulerMutex;
    bool stopScheduler{false};
    std::atomic<bool> isCulling{false};

    mutable std::mutex statsMutex;
    CullStats lastStats;

    Impl(LocalStore& s, std::shared_ptr<IClock> c, VersionGate g)
        : store(s), clock(std::move(c)), gate(std::move(g)) {}

    ~Impl() { stopScheduledCulling(); }

    void stopScheduledCulling() {
        {
            std::lock_guard<std::mutex> lk(schedulerMutex);
            stopScheduler = true;
        }
        schedulerCv.notify_all();
        if (schedulerThread.joinable()) {
            schedulerThread.join();
        }
    }
};

Culler::Culler(LocalStore& store, std::shared_ptr<IClock> clock, VersionGate gate)
    : pImpl(std::make_unique<Impl>(store, clock ? std::move(clock) : makeSystemClock(),
                                   std::move(gate))) {}

Culler::~Culler() = default;

Result<CullStats> Culler::cullMaybe(const std::set<EngineVersion>& pinned,
                                    const CullOptions& options) {
    bool expected = false;
    if (!pImpl->isCulling.compare_exchange_strong(expected, true)) {
        spdlog::warn("[Culler] Cull already in progress");
        return Error{ErrorCode::OperationInProgress, "Cull already in progress"};
    }

    struct CullingGuard {
        std::atomic<bool>& flag;
        ~CullingGuard() { flag = false; }
    } guard{pImpl->isCulling};

    const auto startTime = std::chrono::steady_clock::now();
    CullStats stats{};
    const auto& policy = options.policy;

    try {
        auto installed = pImpl->store.list();
        stats.scanned = installed.size();

        std::vector<EngineInstallation> candidates;
        std::size_t unpinned = 0;
        for (auto& inst : installed) {
            if (pinned.count(inst.version) != 0) {
                ++stats.skipped;
                continue;
            }
            ++unpinned;
            candidates.push_back(std::move(inst));
        }
        std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
            return a.lastUsedAt < b.lastUsedAt;
        });

        spdlog::debug("[Culler] {} installed, {} unpinned (dry_run: {})", stats.scanned, unpinned,
                      options.dryRun);

        const auto now = pImpl->clock->now();
        auto shouldRemove = [&](const EngineInstallation& inst) {
            if (policy.maxAge && now - inst.lastUsedAt > *policy.maxAge) {
                return true;
            }
            return policy.maxInstallations && unpinned > *policy.maxInstallations;
        };

        for (const auto& inst : candidates) {
            if (!shouldRemove(inst)) {
                continue;
            }

            std::optional<RemovalLease> lease;
            if (pImpl->gate) {
                lease = pImpl->gate(inst.version);
                if (!lease) {
                    spdlog::debug("[Culler] Skipping busy or pinned engine {}", inst.version);
                    ++stats.skipped;
                    continue;
                }
            }

            // The scan is a snapshot; a use since then keeps the version
            auto current = pImpl->store.get(inst.version);
            if (!current) {
                --unpinned;
                continue;
            }
            if (current.value().lastUsedAt != inst.lastUsedAt) {
                spdlog::debug("[Culler] Skipping engine {} used since the scan", inst.version);
                ++stats.skipped;
                continue;
            }

            if (!options.dryRun) {
                auto removed = pImpl->store.remove(inst.version);
                if (!removed) {
                    spdlog::warn("[Culler] Failed to remove engine {}: {}", inst.version,
                                 removed.error().message);
                    stats.errors.push_back("Failed to remove " + inst.version + ": " +
                                           removed.error().message);
                    continue;
                }
            }
            lease.reset();

            --unpinned;
            ++stats.removed;
            stats.bytesReclaimed += inst.sizeBytes;
            stats.removedVersions.push_back(inst.version);
            spdlog::info("[Culler] {} engine {} (last used {}s ago)",
                         options.dryRun ? "Would remove" : "Removed", inst.version,
                         std::chrono::duration_cast<std::chrono::seconds>(now - inst.lastUsedAt)
                             .count());
            if (!options.dryRun && options.onRemoved) {
                options.onRemoved(inst);
            }
        }
    } catch (const std::exception& e) {
        stats.errors.push_back(std::string("Exception during cull: ") + e.what());
        spdlog::error("[Culler] Cull failed: {}", e.what());
    }

    stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    {
        std::lock_guard<std::mutex> lock(pImpl->statsMutex);
        pImpl->lastStats = stats;
    }

    spdlog::info("[Culler] Cull completed: {} scanned, {} removed, {} skipped, {} bytes "
                 "reclaimed in {}ms",
                 stats.scanned, stats.removed, stats.skipped, stats.bytesReclaimed,
                 stats.duration.count());
    return stats;
}

void Culler::scheduleCulling(std::chrono::seconds interval, CullOptions options,
                             PinProvider pins) {
    stopScheduledCulling();
    {
        std::lock_guard<std::mutex> lk(pImpl->schedulerMutex);
        pImpl->stopScheduler = false;
    }

    pImpl->schedulerThread = std::thread([this, interval, options = std::move(options),
                                          pins = std::move(pins)]() {
        spdlog::info("[Culler] Started scheduled culling (interval: {}s)", interval.count());
        while (true) {
            {
                std::unique_lock<std::mutex> lock(pImpl->schedulerMutex);
                if (pImpl->schedulerCv.wait_for(lock, interval,
                                                [this] { return pImpl->stopScheduler; })) {
                    break;
                }
            }
            spdlog::debug("[Culler] Running scheduled cull");
            auto pinned = pins ? pins() : std::set<EngineVersion>{};
            auto result = cullMaybe(pinned, options);
            if (!result) {
                spdlog::warn("[Culler] Scheduled cull did not run: {}", result.error().message);
            }
        }
        spdlog::info("[Culler] Stopped scheduled culling");
    });
}

void Culler::stopScheduledCulling() {
    pImpl->stopScheduledCulling();
}

bool Culler::isCulling() const {
    return pImpl->isCulling.load();
}

CullStats Culler::getLastStats() const {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    return pImpl->lastStats;
}

} // namespace enginecache::store

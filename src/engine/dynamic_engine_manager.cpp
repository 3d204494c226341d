/*
 * DynamicEngineManager: downloads engine versions on demand.
 *
 * - One in-flight job per version; concurrent requests attach as waiters
 * - Each waiter has its own promise, progress callback and cancellation registration
 * - The transfer is cancelled only once every waiter has cancelled
 * - Install and removal of a version hold that version's mutex
 * - Removal also holds the pin registry, so a pin either precedes it or sees the version gone
 */

#include <enginecache/engine/engine_manager.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <stop_token>
#include <unordered_map>
#include <utility>

namespace enginecache::engine {

namespace {

template <typename T> std::future<T> readyFuture(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

class DynamicEngineManager final : public IEngineManager,
                                   public std::enable_shared_from_this<DynamicEngineManager> {
public:
    DynamicEngineManager(EngineManagerConfig config, EngineManagerDeps deps)
        : config_(std::move(config)), resolver_(std::move(deps.resolver)),
          downloader_(std::move(deps.downloader)), clock_(std::move(deps.clock)),
          executor_(std::move(deps.executor)), store_(config_.store, clock_),
          culler_(store_, clock_,
                  [this](const EngineVersion& v) { return tryAcquireForRemoval(v); }),
          pins_(std::make_shared<PinRegistry>()) {}

    ~DynamicEngineManager() override { culler_.stopScheduledCulling(); }

    Result<void> start() {
        if (!resolver_) {
            return Error{ErrorCode::InvalidArgument, "No manifest resolver configured"};
        }
        if (!downloader_) {
            return Error{ErrorCode::InvalidArgument, "No package downloader configured"};
        }
        if (!executor_) {
            return Error{ErrorCode::InvalidArgument, "No executor configured"};
        }
        auto opened = store_.open();
        if (!opened) {
            return opened;
        }
        if (config_.cullInterval && config_.cullInterval->count() > 0) {
            culler_.scheduleCulling(*config_.cullInterval, cullOptions(),
                                    [pins = pins_] { return pins->snapshot(); });
        }
        return {};
    }

    Result<std::filesystem::path> getEnginePath(const EngineVersion& version) override {
        return store_.getPath(version);
    }

    Result<std::string> getEngineSignature(const EngineVersion& version) override {
        return store_.getSignature(version);
    }

    std::future<Result<bool>> downloadEngineIfNecessary(const EngineVersion& version,
                                                        downloader::ProgressCallback progress,
                                                        std::stop_token cancel) override {
        if (auto v = store::validateVersion(version); !v) {
            return readyFuture<Result<bool>>(v.error());
        }
        if (store_.has(version)) {
            if (auto t = store_.touch(version); !t) {
                spdlog::debug("[EngineManager] touch({}) failed: {}", version, t.error().message);
            }
            return readyFuture<Result<bool>>(true);
        }
        if (cancel.stop_requested()) {
            return readyFuture<Result<bool>>(false);
        }

        auto waiter = std::make_shared<Waiter>();
        waiter->progress = std::move(progress);
        auto future = waiter->promise.get_future();

        std::shared_ptr<Job> job;
        bool created = false;
        {
            std::lock_guard<std::mutex> lk(inflightMutex_);
            auto it = inflight_.find(version);
            if (it != inflight_.end()) {
                std::lock_guard<std::mutex> jl(it->second->mutex);
                if (!it->second->abandoned) {
                    job = it->second;
                    job->waiters.push_back(waiter);
                }
            }
            if (!job) {
                // An abandoned job is still unwinding; it only erases itself from inflight_
                job = std::make_shared<Job>();
                job->version = version;
                job->waiters.push_back(waiter);
                inflight_[version] = job;
                created = true;
            }
        }
        {
            std::lock_guard<std::mutex> lk(failedMutex_);
            failed_.erase(version);
        }

        // Runs inline when the token was stopped in the meantime. Never destroyed under
        // job->mutex, since its destructor waits for a running callback.
        std::unique_ptr<Registration> registration;
        if (cancel.stop_possible()) {
            registration = std::make_unique<Registration>(
                cancel, std::function<void()>([weakJob = std::weak_ptr<Job>(job),
                                               weakWaiter = std::weak_ptr<Waiter>(waiter)] {
                    if (auto w = weakWaiter.lock())
                        detachWaiter(weakJob, w);
                }));
            std::lock_guard<std::mutex> jl(job->mutex);
            if (!waiter->done)
                waiter->registration = std::move(registration);
        }

        if (created) {
            spdlog::debug("[EngineManager] Starting install job for {}", version);
            boost::asio::post(executor_, [self = shared_from_this(), job] { self->run(job); });
        } else {
            spdlog::debug("[EngineManager] Joining in-flight install of {}", version);
        }
        return future;
    }

    std::future<Result<store::CullStats>>
    doEngineCullMaybeAsync(std::set<EngineVersion> extraPins) override {
        auto promise = std::make_shared<std::promise<Result<store::CullStats>>>();
        auto future = promise->get_future();
        boost::asio::post(executor_, [self = shared_from_this(), promise,
                                      extraPins = std::move(extraPins)]() mutable {
            auto pinned = self->pins_->snapshot();
            pinned.insert(extraPins.begin(), extraPins.end());
            promise->set_value(self->culler_.cullMaybe(pinned, self->cullOptions()));
        });
        return future;
    }

    Result<void> clearAllEngines() override {
        std::optional<Error> firstError;
        std::size_t removed = 0;
        for (const auto& inst : store_.list()) {
            if (pins_->isPinned(inst.version)) {
                spdlog::info("[EngineManager] Keeping pinned engine {}", inst.version);
                continue;
            }
            auto lease = tryAcquireForRemoval(inst.version);
            if (!lease) {
                spdlog::info("[EngineManager] Keeping busy or pinned engine {}", inst.version);
                continue;
            }
            auto r = store_.remove(inst.version);
            lease.reset();
            pruneVersionMutex(inst.version);
            if (!r) {
                spdlog::warn("[EngineManager] Failed to remove engine {}: {}", inst.version,
                             r.error().message);
                if (!firstError)
                    firstError = r.error();
                continue;
            }
            ++removed;
            publishEvicted(inst);
        }
        spdlog::info("[EngineManager] Cleared {} engine installations", removed);
        if (firstError)
            return *firstError;
        return {};
    }

    EngineState state(const EngineVersion& version) const override {
        {
            std::lock_guard<std::mutex> lk(inflightMutex_);
            auto it = inflight_.find(version);
            if (it != inflight_.end())
                return it->second->state.load();
        }
        if (store_.has(version))
            return EngineState::Installed;
        std::lock_guard<std::mutex> lk(failedMutex_);
        return failed_.count(version) != 0 ? EngineState::Failed : EngineState::Absent;
    }

    EnginePin pin(const EngineVersion& version) override { return EnginePin{pins_, version}; }

    std::shared_ptr<EngineEventQueue> events(std::size_t capacity) override {
        return bus_.subscribe(capacity);
    }

    std::vector<store::EngineInstallation> list() const override { return store_.list(); }

private:
    using Registration = std::stop_callback<std::function<void()>>;

    struct Waiter {
        std::promise<Result<bool>> promise;
        downloader::ProgressCallback progress;
        std::unique_ptr<Registration> registration;
        bool done{false};
    };

    struct Job {
        EngineVersion version;
        std::stop_source cancel;
        std::atomic<EngineState> state{EngineState::Resolving};
        std::mutex mutex;
        std::vector<std::shared_ptr<Waiter>> waiters;
        bool abandoned{false}; // every waiter left; new requests start a fresh job
    };

    // A cancelled waiter completes with false; the last one to leave stops the transfer.
    static void detachWaiter(const std::weak_ptr<Job>& weakJob,
                             const std::shared_ptr<Waiter>& waiter) {
        auto job = weakJob.lock();
        if (!job)
            return;
        bool abandon = false;
        {
            std::lock_guard<std::mutex> jl(job->mutex);
            if (waiter->done)
                return;
            waiter->done = true;
            auto& ws = job->waiters;
            ws.erase(std::remove(ws.begin(), ws.end(), waiter), ws.end());
            abandon = ws.empty();
            job->abandoned = abandon;
        }
        waiter->promise.set_value(false);
        if (abandon) {
            spdlog::info("[EngineManager] All waiters cancelled; aborting install of {}",
                         job->version);
            job->cancel.request_stop();
        }
    }

    std::shared_ptr<std::mutex> versionMutex(const EngineVersion& version) {
        std::lock_guard<std::mutex> lk(versionLocksMutex_);
        auto& m = versionLocks_[version];
        if (!m)
            m = std::make_shared<std::mutex>();
        return m;
    }

    // Drop the version's mutex once nothing references it
    void pruneVersionMutex(const EngineVersion& version) {
        std::lock_guard<std::mutex> lk(versionLocksMutex_);
        auto it = versionLocks_.find(version);
        if (it != versionLocks_.end() && it->second.use_count() == 1)
            versionLocks_.erase(it);
    }

    // Lock order: version mutex, then pin registry. pin() only takes the registry lock.
    std::optional<store::RemovalLease> tryAcquireForRemoval(const EngineVersion& version) {
        {
            std::lock_guard<std::mutex> lk(inflightMutex_);
            if (inflight_.count(version) != 0)
                return std::nullopt;
        }
        store::RemovalLease lease;
        lease.versionMutex = versionMutex(version);
        lease.versionLock = std::unique_lock<std::mutex>(*lease.versionMutex, std::try_to_lock);
        if (!lease.versionLock.owns_lock())
            return std::nullopt;
        lease.pinLock = pins_->holdUnpinned(version);
        if (!lease.pinLock.owns_lock())
            return std::nullopt;
        return lease;
    }

    store::CullOptions cullOptions() {
        store::CullOptions options;
        options.policy = config_.cullPolicy;
        options.onRemoved = [this](const store::EngineInstallation& inst) {
            pruneVersionMutex(inst.version);
            publishEvicted(inst);
        };
        return options;
    }

    void publishEvicted(const store::EngineInstallation& inst) {
        EngineEvent ev;
        ev.kind = EngineEventKind::Evicted;
        ev.version = inst.version;
        ev.downloadedBytes = inst.sizeBytes;
        bus_.publish(ev);
    }

    void forwardProgress(Job& job, const downloader::ProgressEvent& ev) {
        std::vector<std::shared_ptr<Waiter>> waiters;
        {
            std::lock_guard<std::mutex> jl(job.mutex);
            waiters = job.waiters;
        }
        for (const auto& w : waiters) {
            if (w->progress)
                w->progress(ev);
        }
        EngineEvent out;
        out.kind = EngineEventKind::Progress;
        out.version = job.version;
        out.downloadedBytes = ev.downloadedBytes;
        out.totalBytes = ev.totalBytes;
        bus_.publish(out);
    }

    void stageChanged(Job& job, EngineState state, downloader::ProgressStage stage) {
        job.state = state;
        downloader::ProgressEvent ev;
        ev.stage = stage;
        forwardProgress(job, ev);
    }

    Result<bool> install(Job& job) {
        const auto& version = job.version;
        const auto token = job.cancel.get_token();
        if (store_.has(version)) {
            return true;
        }

        stageChanged(job, EngineState::Resolving, downloader::ProgressStage::Resolving);
        auto entry = resolver_->resolve(version, token);
        if (!entry) {
            return entry.error();
        }
        const auto& descriptor = entry.value();
        if (descriptor.insecure) {
            spdlog::warn("[EngineManager] Installing engine {} which the manifest marks insecure",
                         version);
        }

        const int attempts = 1 + std::max(0, config_.corruptRetries);
        for (int attempt = 1; attempt <= attempts; ++attempt) {
            auto staging = store_.stagingPath(version);
            if (!staging) {
                return staging.error();
            }
            const auto stagingDir = staging.value();
            const auto packagePath = stagingDir / store_.packageFileName();

            stageChanged(job, EngineState::Downloading, downloader::ProgressStage::Connecting);
            auto fetched = downloader_->fetch(
                descriptor.downloadUrl, packagePath,
                [this, &job](const downloader::ProgressEvent& ev) { forwardProgress(job, ev); },
                token);
            if (!fetched) {
                store_.discardStaging(stagingDir);
                return fetched.error();
            }
            if (descriptor.sizeBytes && *descriptor.sizeBytes != fetched.value().bytesWritten) {
                spdlog::debug("[EngineManager] {}: manifest size {} differs from fetched {}",
                              version, *descriptor.sizeBytes, fetched.value().bytesWritten);
            }

            stageChanged(job, EngineState::Verifying, downloader::ProgressStage::Verifying);
            auto verified =
                verifier_.verifyDigest(fetched.value().sha256, descriptor.expectedSignature);
            if (!verified) {
                store_.discardStaging(stagingDir);
                if (verified.error().code == ErrorCode::HashMismatch && attempt < attempts) {
                    spdlog::warn("[EngineManager] Signature mismatch for {} (attempt {}/{}), "
                                 "retrying download",
                                 version, attempt, attempts);
                    continue;
                }
                return verified.error();
            }
            if (token.stop_requested()) {
                store_.discardStaging(stagingDir);
                return Error{ErrorCode::OperationCancelled, "Install cancelled: " + version};
            }

            auto committed = store_.commit(version, stagingDir, descriptor.expectedSignature);
            if (!committed) {
                store_.discardStaging(stagingDir);
                return committed.error();
            }
            return true;
        }
        return Error{ErrorCode::InternalError, "Install loop exhausted for " + version};
    }

    void run(const std::shared_ptr<Job>& job) {
        Result<bool> outcome = false;
        {
            auto m = versionMutex(job->version);
            std::lock_guard<std::mutex> versionLock(*m);
            try {
                outcome = install(*job);
            } catch (const std::exception& e) {
                outcome = Error{ErrorCode::InternalError,
                                std::string("Exception during engine install: ") + e.what()};
            }
            {
                std::lock_guard<std::mutex> lk(inflightMutex_);
                auto it = inflight_.find(job->version);
                if (it != inflight_.end() && it->second == job)
                    inflight_.erase(it);
            }
        }
        pruneVersionMutex(job->version);

        const bool cancelled = !outcome && outcome.error().code == ErrorCode::OperationCancelled;
        if (outcome) {
            job->state = EngineState::Installed;
            {
                std::lock_guard<std::mutex> lk(failedMutex_);
                failed_.erase(job->version);
            }
            spdlog::info("[EngineManager] Engine {} ready", job->version);
            EngineEvent ev;
            ev.kind = EngineEventKind::Installed;
            ev.version = job->version;
            bus_.publish(ev);
        } else if (cancelled) {
            job->state = EngineState::Absent;
            spdlog::info("[EngineManager] Install of {} cancelled", job->version);
        } else {
            job->state = EngineState::Failed;
            spdlog::error("[EngineManager] Install of {} failed: {}", job->version,
                          outcome.error().message);
            {
                std::lock_guard<std::mutex> lk(failedMutex_);
                failed_.insert(job->version);
            }
            EngineEvent ev;
            ev.kind = EngineEventKind::Failed;
            ev.version = job->version;
            ev.error = outcome.error();
            bus_.publish(ev);
        }

        std::vector<std::shared_ptr<Waiter>> waiters;
        {
            std::lock_guard<std::mutex> jl(job->mutex);
            for (auto& w : job->waiters) {
                w->done = true;
            }
            waiters.swap(job->waiters);
        }
        for (auto& w : waiters) {
            w->registration.reset();
            if (cancelled) {
                w->promise.set_value(false);
            } else {
                w->promise.set_value(outcome);
            }
        }
    }

    EngineManagerConfig config_;
    std::shared_ptr<manifest::IManifestResolver> resolver_;
    std::unique_ptr<downloader::IPackageDownloader> downloader_;
    std::shared_ptr<IClock> clock_;
    boost::asio::any_io_executor executor_;
    downloader::IntegrityVerifier verifier_;
    EngineEventBus bus_;

    store::LocalStore store_;
    store::Culler culler_;
    std::shared_ptr<PinRegistry> pins_;

    mutable std::mutex inflightMutex_;
    std::unordered_map<EngineVersion, std::shared_ptr<Job>> inflight_;

    std::mutex versionLocksMutex_;
    std::unordered_map<EngineVersion, std::shared_ptr<std::mutex>> versionLocks_;

    mutable std::mutex failedMutex_;
    std::set<EngineVersion> failed_;
};

} // namespace

Result<std::shared_ptr<IEngineManager>> makeDynamicEngineManager(EngineManagerConfig config,
                                                                 EngineManagerDeps deps) {
    if (!deps.clock) {
        deps.clock = makeSystemClock();
    }
    if (!deps.downloader) {
        if (!deps.http) {
            deps.http = downloader::makeCurlHttpAdapter();
        }
        deps.downloader = downloader::makePackageDownloader(deps.http, config.download);
    }
    if (!deps.resolver && deps.http) {
        manifest::ManifestConfig mc;
        mc.http = config.download.http;
        deps.resolver = std::make_shared<manifest::ManifestResolver>(mc, deps.http, deps.clock);
    }

    const bool cullOnStartup = config.cullOnStartup;
    auto manager = std::make_shared<DynamicEngineManager>(std::move(config), std::move(deps));
    auto started = manager->start();
    if (!started) {
        return started.error();
    }
    if (cullOnStartup) {
        // Result is logged by the culler
        (void)manager->doEngineCullMaybeAsync({});
    }
    return std::shared_ptr<IEngineManager>(std::move(manager));
}

} // namespace enginecache::engine

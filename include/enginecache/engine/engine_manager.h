#pragma once

#include <enginecache/core/cancellation.h>
#include <enginecache/core/clock.h>
#include <enginecache/core/types.h>
#include <enginecache/downloader/downloader.hpp>
#include <enginecache/engine/event_bus.h>
#include <enginecache/manifest/manifest_resolver.h>
#include <enginecache/store/culler.h>
#include <enginecache/store/local_store.h>

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace enginecache::engine {

enum class EngineState { Absent, Resolving, Downloading, Verifying, Installed, Failed };

constexpr const char* stateToString(EngineState state) {
    switch (state) {
        case EngineState::Absent: return "absent";
        case EngineState::Resolving: return "resolving";
        case EngineState::Downloading: return "downloading";
        case EngineState::Verifying: return "verifying";
        case EngineState::Installed: return "installed";
        case EngineState::Failed: return "failed";
    }
    return "unknown";
}

/// Reference-counted set of versions held by running sessions.
class PinRegistry {
public:
    void add(const EngineVersion& version);
    void release(const EngineVersion& version);
    [[nodiscard]] bool isPinned(const EngineVersion& version) const;
    [[nodiscard]] std::set<EngineVersion> snapshot() const;

    /// Registry lock owned while `version` stays unpinned; empty if it is pinned.
    [[nodiscard]] std::unique_lock<std::mutex> holdUnpinned(const EngineVersion& version);

private:
    mutable std::mutex mutex_;
    std::map<EngineVersion, std::size_t> counts_;
};

/**
 * Keeps a version out of culling and clearing while alive.
 */
class EnginePin {
public:
    EnginePin() = default;
    EnginePin(std::shared_ptr<PinRegistry> registry, EngineVersion version);
    ~EnginePin() { release(); }

    EnginePin(const EnginePin&) = delete;
    EnginePin& operator=(const EnginePin&) = delete;
    EnginePin(EnginePin&& other) noexcept;
    EnginePin& operator=(EnginePin&& other) noexcept;

    void release() noexcept;

    [[nodiscard]] const EngineVersion& version() const noexcept { return version_; }
    explicit operator bool() const noexcept { return registry_ != nullptr; }

private:
    std::shared_ptr<PinRegistry> registry_;
    EngineVersion version_;
};

/**
 * Public contract for obtaining engine installations.
 *
 * Futures complete on the manager's executor. A download future holds true once the version
 * is installed, false when the caller's token was cancelled first, or the failure.
 */
class IEngineManager {
public:
    virtual ~IEngineManager() = default;

    virtual Result<std::filesystem::path> getEnginePath(const EngineVersion& version) = 0;
    virtual Result<std::string> getEngineSignature(const EngineVersion& version) = 0;

    virtual std::future<Result<bool>>
    downloadEngineIfNecessary(const EngineVersion& version,
                              downloader::ProgressCallback progress = {},
                              std::stop_token cancel = {}) = 0;

    virtual std::future<Result<store::CullStats>>
    doEngineCullMaybeAsync(std::set<EngineVersion> extraPins = {}) = 0;

    virtual Result<void> clearAllEngines() = 0;

    [[nodiscard]] virtual EngineState state(const EngineVersion& version) const = 0;
    virtual EnginePin pin(const EngineVersion& version) = 0;
    virtual std::shared_ptr<EngineEventQueue>
    events(std::size_t capacity = EngineEventBus::kDefaultCapacity) = 0;
    [[nodiscard]] virtual std::vector<store::EngineInstallation> list() const = 0;
};

struct EngineManagerConfig {
    store::LocalStoreConfig store;
    downloader::DownloaderConfig download;
    store::CullPolicy cullPolicy;
    std::optional<std::chrono::seconds> cullInterval; // periodic culling when set
    bool cullOnStartup{false};
    int corruptRetries{1};
};

/**
 * Collaborators of the download-on-demand manager. Null members are filled with defaults
 * (system clock, libcurl-backed downloader over `http`).
 */
struct EngineManagerDeps {
    std::shared_ptr<manifest::IManifestResolver> resolver;
    std::shared_ptr<downloader::IHttpAdapter> http;
    std::unique_ptr<downloader::IPackageDownloader> downloader;
    std::shared_ptr<IClock> clock;
    boost::asio::any_io_executor executor;
};

/// Open the store under config.store.root and build a DynamicEngineManager.
Result<std::shared_ptr<IEngineManager>> makeDynamicEngineManager(EngineManagerConfig config,
                                                                 EngineManagerDeps deps);

/// Read-only manager over packages shipped under `bundleDir/<version>/`.
Result<std::shared_ptr<IEngineManager>>
makeBundledEngineManager(std::filesystem::path bundleDir,
                         std::string packageFileName = "engine.zip");

} // namespace enginecache::engine

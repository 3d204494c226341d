// Read-only manager for engine packages shipped alongside the application.

#include <enginecache/downloader/disk_writer.h>
#include <enginecache/engine/engine_manager.h>

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace enginecache::engine {

namespace {

namespace fs = std::filesystem;

class BundledEngineManager final : public IEngineManager {
public:
    BundledEngineManager(fs::path dir, std::string packageFileName)
        : dir_(std::move(dir)), packageFileName_(std::move(packageFileName)),
          pins_(std::make_shared<PinRegistry>()) {}

    Result<void> scan() {
        std::error_code ec;
        if (!fs::is_directory(dir_, ec)) {
            return Error{ErrorCode::NotFound, "Bundle directory not found: " + dir_.string()};
        }
        for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code te;
            if (!it->is_directory(te))
                continue;
            const auto version = it->path().filename().string();
            if (!store::validateVersion(version))
                continue;
            if (!fs::is_regular_file(it->path() / packageFileName_, te))
                continue;

            auto inst = store::loadSidecar(it->path(), packageFileName_);
            if (inst) {
                bundled_.emplace(version, std::move(inst).value());
                continue;
            }
            // No record shipped with the package: sign it ourselves
            auto sig = verifier_.computeSignature(it->path() / packageFileName_);
            if (!sig) {
                spdlog::warn("[BundledEngineManager] Skipping {}: {}", version,
                             sig.error().message);
                continue;
            }
            store::EngineInstallation rec;
            rec.version = version;
            rec.installPath = it->path();
            rec.signature = sig.value();
            rec.packageFile = packageFileName_;
            rec.sizeBytes = downloader::directorySize(it->path());
            bundled_.emplace(version, std::move(rec));
        }
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Failed to scan bundle directory " + dir_.string() + ": " + ec.message()};
        }
        spdlog::info("[BundledEngineManager] {} bundled engine(s) under {}", bundled_.size(),
                     dir_.string());
        return {};
    }

    Result<std::filesystem::path> getEnginePath(const EngineVersion& version) override {
        auto it = bundled_.find(version);
        if (it == bundled_.end())
            return Error{ErrorCode::NotFound, "Engine version not bundled: " + version};
        return it->second.installPath;
    }

    Result<std::string> getEngineSignature(const EngineVersion& version) override {
        auto it = bundled_.find(version);
        if (it == bundled_.end())
            return Error{ErrorCode::NotFound, "Engine version not bundled: " + version};
        return it->second.signature;
    }

    std::future<Result<bool>> downloadEngineIfNecessary(const EngineVersion& version,
                                                        downloader::ProgressCallback,
                                                        std::stop_token) override {
        std::promise<Result<bool>> p;
        if (bundled_.count(version) != 0) {
            p.set_value(true);
        } else {
            p.set_value(Error{ErrorCode::NotFound, "Engine version not bundled: " + version});
        }
        return p.get_future();
    }

    std::future<Result<store::CullStats>>
    doEngineCullMaybeAsync(std::set<EngineVersion>) override {
        std::promise<Result<store::CullStats>> p;
        store::CullStats stats;
        stats.scanned = bundled_.size();
        p.set_value(stats);
        return p.get_future();
    }

    Result<void> clearAllEngines() override { return {}; }

    EngineState state(const EngineVersion& version) const override {
        return bundled_.count(version) != 0 ? EngineState::Installed : EngineState::Absent;
    }

    EnginePin pin(const EngineVersion& version) override { return EnginePin{pins_, version}; }

    std::shared_ptr<EngineEventQueue> events(std::size_t capacity) override {
        return bus_.subscribe(capacity);
    }

    std::vector<store::EngineInstallation> list() const override {
        std::vector<store::EngineInstallation> out;
        out.reserve(bundled_.size());
        for (const auto& [version, inst] : bundled_)
            out.push_back(inst);
        return out;
    }

private:
    fs::path dir_;
    std::string packageFileName_;
    std::map<EngineVersion, store::EngineInstallation> bundled_;
    std::shared_ptr<PinRegistry> pins_;
    downloader::IntegrityVerifier verifier_;
    EngineEventBus bus_;
};

} // namespace

Result<std::shared_ptr<IEngineManager>> makeBundledEngineManager(std::filesystem::path bundleDir,
                                                                 std::string packageFileName) {
    if (packageFileName.empty())
        packageFileName = "engine.zip";
    auto manager =
        std::make_shared<BundledEngineManager>(std::move(bundleDir), std::move(packageFileName));
    auto scanned = manager->scan();
    if (!scanned)
        return scanned.error();
    return std::shared_ptr<IEngineManager>(std::move(manager));
}

} // namespace enginecache::engine

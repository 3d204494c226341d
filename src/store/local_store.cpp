#include <enginecache/downloader/disk_writer.h>
#include <enginecache/store/local_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace enginecache::store {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

// Write a small file next to its final name and rename it into place.
Result<void> writeFileAtomic(const fs::path& target, const std::string& content) {
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IOError, "Cannot write " + tmp.string()};
        }
        out << content;
        out.flush();
        if (!out.good()) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return Error{ErrorCode::IOError, "Short write to " + tmp.string()};
        }
    }
    if (auto r = downloader::fsyncFile(tmp); !r) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return r;
    }
    return downloader::renameAtomic(tmp, target);
}

} // namespace

Result<void> validateVersion(std::string_view version) {
    if (version.empty()) {
        return Error{ErrorCode::InvalidArgument, "Engine version must not be empty"};
    }
    if (version == "." || version == ".." || version.front() == '.') {
        return Error{ErrorCode::InvalidArgument,
                     "Engine version must not start with '.': " + std::string(version)};
    }
    for (char c : version) {
        if (c == '/' || c == '\\' || c == '\0') {
            return Error{ErrorCode::InvalidArgument,
                         "Engine version contains a path separator: " + std::string(version)};
        }
    }
    return {};
}

LocalStore::LocalStore(LocalStoreConfig config, std::shared_ptr<IClock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = makeSystemClock();
    }
    if (config_.packageFileName.empty()) {
        config_.packageFileName = "engine.zip";
    }
}

LocalStore::~LocalStore() {
    unlockRoot();
}

bool LocalStore::lockRoot() {
    unlockRoot();
    const auto lockPath = config_.root / kLockFileName;
    lockFd_ = ::open(lockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (lockFd_ == -1) {
        spdlog::warn("[LocalStore] Cannot open {}: {}", lockPath.string(), std::strerror(errno));
        return false;
    }
    if (::flock(lockFd_, LOCK_EX | LOCK_NB) == 0) {
        return true;
    }
    if (errno != EWOULDBLOCK) {
        spdlog::warn("[LocalStore] Cannot lock {}: {}", lockPath.string(), std::strerror(errno));
    }
    // Another store owns the root; wait out its startup cleanup and share it
    while (::flock(lockFd_, LOCK_SH) == -1 && errno == EINTR) {
    }
    return false;
}

void LocalStore::unlockRoot() noexcept {
    if (lockFd_ != -1) {
        ::close(lockFd_);
        lockFd_ = -1;
    }
}

Result<void> LocalStore::writeSidecar(const EngineInstallation& inst, const fs::path& dir) const {
    json j;
    j["format"] = kFormatVersion;
    j["version"] = inst.version;
    j["signature"] = inst.signature;
    j["installed_at"] = toUnixSeconds(inst.installedAt);
    j["last_used_at"] = toUnixSeconds(inst.lastUsedAt);
    j["size_bytes"] = inst.sizeBytes;
    j["package"] = inst.packageFile;
    return writeFileAtomic(dir / kSidecarName, j.dump(2));
}

Result<EngineInstallation> loadSidecar(const fs::path& dir,
                                       const std::string& defaultPackageName) {
    const auto sidecar = dir / LocalStore::kSidecarName;
    std::ifstream in(sidecar, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "No sidecar in " + dir.string()};
    }
    std::stringstream ss;
    ss << in.rdbuf();

    try {
        auto j = json::parse(ss.str());
        if (!j.is_object() || j.value("format", 0) != LocalStore::kFormatVersion) {
            return Error{ErrorCode::InvalidState, "Unsupported sidecar format in " + dir.string()};
        }
        EngineInstallation inst;
        inst.version = j.at("version").get<std::string>();
        inst.signature = j.at("signature").get<std::string>();
        inst.installedAt = fromUnixSeconds(j.value("installed_at", std::int64_t{0}));
        inst.lastUsedAt = fromUnixSeconds(j.value("last_used_at", std::int64_t{0}));
        inst.sizeBytes = j.value("size_bytes", std::uint64_t{0});
        inst.packageFile = j.value("package", defaultPackageName);
        inst.installPath = dir;
        if (inst.signature.empty()) {
            return Error{ErrorCode::InvalidState, "Sidecar without signature in " + dir.string()};
        }
        return inst;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidState,
                     "Malformed sidecar " + sidecar.string() + ": " + e.what()};
    }
}

Result<void> LocalStore::open() {
    if (config_.root.empty()) {
        return Error{ErrorCode::InvalidArgument, "Store root is not configured"};
    }
    if (auto r = downloader::ensurePrivateDir(config_.root); !r) {
        return r;
    }

    std::map<EngineVersion, EngineInstallation> loaded;
    std::size_t discarded = 0;

    // With the root to ourselves, staging leftovers are orphans of an interrupted install
    if (lockRoot()) {
        if (auto r = downloader::removeTree(stagingRoot()); !r) {
            spdlog::warn("[LocalStore] Failed to clear staging area: {}", r.error().message);
        }
        if (::flock(lockFd_, LOCK_SH) == -1) {
            spdlog::warn("[LocalStore] Cannot share store lock: {}", std::strerror(errno));
        }
    } else {
        spdlog::debug("[LocalStore] {} is open elsewhere; keeping its staging area",
                      config_.root.string());
    }

    std::error_code ec;
    for (fs::directory_iterator it(config_.root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code te;
        if (!it->is_directory(te) || te) {
            continue;
        }
        const auto name = it->path().filename().string();
        if (!name.empty() && name.front() == '.') {
            continue;
        }

        auto inst = loadSidecar(it->path(), config_.packageFileName);
        bool valid = inst.has_value();
        std::string reason = valid ? std::string() : inst.error().message;
        if (valid && inst.value().version != name) {
            valid = false;
            reason = "sidecar names version " + inst.value().version;
        }
        if (valid && !fs::exists(inst.value().packagePath(), te)) {
            valid = false;
            reason = "package file missing";
        }
        if (!valid) {
            spdlog::warn("[LocalStore] Discarding incomplete installation {}: {}", name, reason);
            if (auto r = downloader::removeTree(it->path()); !r) {
                spdlog::warn("[LocalStore] {}", r.error().message);
            }
            ++discarded;
            continue;
        }
        loaded.emplace(name, std::move(inst).value());
    }
    if (ec) {
        return Error{ErrorCode::IOError,
                     "Failed to scan store root " + config_.root.string() + ": " + ec.message()};
    }

    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        index_ = std::move(loaded);
        count = index_.size();
    }
    spdlog::info("[LocalStore] Opened {} ({} installations, {} discarded)",
                 config_.root.string(), count, discarded);
    return {};
}

bool LocalStore::has(const EngineVersion& version) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return index_.count(version) != 0;
}

Result<fs::path> LocalStore::getPath(const EngineVersion& version) {
    fs::path path;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = index_.find(version);
        if (it == index_.end()) {
            return Error{ErrorCode::NotFound, "Engine version not installed: " + version};
        }
        path = it->second.installPath;
    }
    if (auto r = touch(version); !r) {
        spdlog::debug("[LocalStore] touch({}) failed: {}", version, r.error().message);
    }
    return path;
}

Result<std::string> LocalStore::getSignature(const EngineVersion& version) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = index_.find(version);
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, "Engine version not installed: " + version};
    }
    return it->second.signature;
}

Result<EngineInstallation> LocalStore::get(const EngineVersion& version) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = index_.find(version);
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, "Engine version not installed: " + version};
    }
    return it->second;
}

std::vector<EngineInstallation> LocalStore::list() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<EngineInstallation> out;
    out.reserve(index_.size());
    for (const auto& [version, inst] : index_) {
        out.push_back(inst);
    }
    return out;
}

std::size_t LocalStore::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return index_.size();
}

Result<fs::path> LocalStore::stagingPath(const EngineVersion& version) {
    if (auto v = validateVersion(version); !v) {
        return v.error();
    }
    std::uint64_t n = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        n = ++stagingCounter_;
    }
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = stagingRoot() / (version + "." + std::to_string(stamp) + "-" + std::to_string(n));
    if (auto r = downloader::ensurePrivateDir(dir); !r) {
        return r.error();
    }
    return dir;
}

void LocalStore::discardStaging(const fs::path& stagingDir) noexcept {
    if (stagingDir.empty())
        return;
    if (auto r = downloader::removeTree(stagingDir); !r) {
        spdlog::warn("[LocalStore] Failed to discard staging dir: {}", r.error().message);
    }
}

Result<EngineInstallation> LocalStore::commit(const EngineVersion& version,
                                              const fs::path& stagingDir,
                                              std::string_view signature) {
    if (auto v = validateVersion(version); !v) {
        return v.error();
    }
    std::error_code ec;
    if (!fs::is_regular_file(stagingDir / config_.packageFileName, ec)) {
        return Error{ErrorCode::InvalidState,
                     "Staging directory has no package: " + stagingDir.string()};
    }

    EngineInstallation inst;
    inst.version = version;
    inst.installPath = config_.root / version;
    inst.signature = std::string(signature);
    inst.installedAt = clock_->now();
    inst.lastUsedAt = inst.installedAt;
    inst.sizeBytes = downloader::directorySize(stagingDir);
    inst.packageFile = config_.packageFileName;

    if (auto r = writeSidecar(inst, stagingDir); !r) {
        return r.error();
    }
    if (auto r = downloader::fsyncDir(stagingDir); !r) {
        return r.error();
    }

    std::lock_guard<std::mutex> lk(mutex_);

    // Move an occupying directory aside so a failed rename can be rolled back
    fs::path displaced;
    if (fs::exists(inst.installPath, ec)) {
        displaced = stagingDir;
        displaced += ".old";
        if (auto r = downloader::renameAtomic(inst.installPath, displaced); !r) {
            return r.error();
        }
    }

    if (auto r = downloader::renameAtomic(stagingDir, inst.installPath); !r) {
        if (!displaced.empty()) {
            if (auto back = downloader::renameAtomic(displaced, inst.installPath); !back) {
                spdlog::error("[LocalStore] Failed to restore {}: {}", version,
                              back.error().message);
            }
        }
        return r.error();
    }
    if (auto r = downloader::fsyncDir(config_.root); !r) {
        spdlog::debug("[LocalStore] {}", r.error().message);
    }
    if (!displaced.empty()) {
        if (auto r = downloader::removeTree(displaced); !r) {
            spdlog::warn("[LocalStore] {}", r.error().message);
        }
    }

    index_[version] = inst;
    spdlog::info("[LocalStore] Installed engine {} ({} bytes)", version, inst.sizeBytes);
    return inst;
}

Result<void> LocalStore::touch(const EngineVersion& version) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = index_.find(version);
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, "Engine version not installed: " + version};
    }
    it->second.lastUsedAt = clock_->now();
    // The in-memory timestamp is authoritative for this process
    return writeSidecar(it->second, it->second.installPath);
}

Result<std::uint64_t> LocalStore::remove(const EngineVersion& version) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = index_.find(version);
    fs::path dir = config_.root / version;
    std::uint64_t bytes = 0;
    if (it != index_.end()) {
        dir = it->second.installPath;
        bytes = it->second.sizeBytes;
    } else if (!validateVersion(version)) {
        return std::uint64_t{0};
    }
    if (auto r = downloader::removeTree(dir); !r) {
        return r.error();
    }
    if (it != index_.end()) {
        index_.erase(it);
        spdlog::info("[LocalStore] Removed engine {}", version);
    }
    return bytes;
}

Result<void> LocalStore::removeAll() {
    std::vector<EngineVersion> versions;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& [version, inst] : index_) {
            versions.push_back(version);
        }
    }
    std::optional<Error> firstError;
    for (const auto& version : versions) {
        auto r = remove(version);
        if (!r && !firstError) {
            firstError = r.error();
        }
    }
    if (firstError) {
        return *firstError;
    }
    return {};
}

} // namespace enginecache::store

#include <enginecache/manifest/manifest_resolver.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <initializer_list>
#include <set>
#include <utility>

namespace enginecache::manifest {

using nlohmann::json;

namespace {

constexpr int kSupportedSchema = 1;

std::optional<std::string> firstString(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string()) {
            auto value = it->get<std::string>();
            if (!value.empty())
                return value;
        }
    }
    return std::nullopt;
}

// Parse a {url, sig} leaf. Returns an error describing what is missing.
Result<ManifestEntry> parseLeaf(const EngineVersion& version, const json& leaf) {
    if (!leaf.is_object()) {
        return Error{ErrorCode::ManifestInvalid, "Manifest entry for " + version +
                                                     " is not an object"};
    }
    auto url = firstString(leaf, {"downloadUrl", "url"});
    auto sig = firstString(leaf, {"signature", "sig", "sha256"});
    if (!url || !sig) {
        return Error{ErrorCode::ManifestInvalid,
                     "Manifest entry for " + version + " lacks " +
                         (url ? std::string("a signature") : std::string("a download URL"))};
    }
    ManifestEntry entry;
    entry.version = version;
    entry.downloadUrl = std::move(*url);
    entry.expectedSignature = std::move(*sig);
    for (const char* key : {"size", "sizeBytes"}) {
        auto it = leaf.find(key);
        if (it != leaf.end() && it->is_number_unsigned()) {
            entry.sizeBytes = it->get<std::uint64_t>();
            break;
        }
    }
    return entry;
}

} // namespace

std::string hostPlatform() {
#if defined(_WIN32)
    const char* os = "win";
#elif defined(__APPLE__)
    const char* os = "osx";
#elif defined(__FreeBSD__)
    const char* os = "freebsd";
#else
    const char* os = "linux";
#endif
#if defined(__aarch64__) || defined(_M_ARM64)
    const char* arch = "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    const char* arch = "x86";
#else
    const char* arch = "x64";
#endif
    return std::string(os) + "-" + arch;
}

// ---------- BuildManifest ----------

Result<BuildManifest> BuildManifest::parse(std::string_view document, std::string_view platform) {
    json root;
    try {
        root = json::parse(document.begin(), document.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::ManifestInvalid, std::string("Manifest is not valid JSON: ") +
                                                     e.what()};
    }

    if (root.is_object() && root.contains("versions") &&
        (root["versions"].is_object() || root["versions"].is_array())) {
        const auto schemaIt = root.find("schema");
        if (schemaIt != root.end()) {
            if (!schemaIt->is_number_integer() || schemaIt->get<int>() > kSupportedSchema ||
                schemaIt->get<int>() < 1) {
                return Error{ErrorCode::ManifestInvalid,
                             "Unsupported manifest schema: " + schemaIt->dump()};
            }
        }
        json inner = std::move(root["versions"]);
        root = std::move(inner);
    }

    BuildManifest manifest;
    auto addRecord = [&](const EngineVersion& version, const json& value) {
        Record rec;
        if (!value.is_object()) {
            rec.problem = Error{ErrorCode::ManifestInvalid,
                                "Manifest entry for " + version + " is not an object"};
            manifest.records_[version] = std::move(rec);
            return;
        }
        if (auto redirect = firstString(value, {"redirect"})) {
            rec.redirect = std::move(*redirect);
            manifest.records_[version] = std::move(rec);
            return;
        }
        const bool insecure = value.value("insecure", false);

        const auto platformsIt = value.find("platforms");
        Result<ManifestEntry> leaf = Error{ErrorCode::NotFound};
        if (platformsIt != value.end() && platformsIt->is_object()) {
            const auto leafIt = platformsIt->find(std::string(platform));
            if (leafIt == platformsIt->end()) {
                rec.problem = Error{ErrorCode::NotFound, "No build of " + version +
                                                             " for platform " +
                                                             std::string(platform)};
                manifest.records_[version] = std::move(rec);
                return;
            }
            leaf = parseLeaf(version, *leafIt);
        } else {
            leaf = parseLeaf(version, value);
        }

        if (leaf) {
            auto entry = std::move(leaf).value();
            entry.insecure = insecure;
            rec.entry = std::move(entry);
        } else {
            rec.problem = leaf.error();
        }
        manifest.records_[version] = std::move(rec);
    };

    if (root.is_object()) {
        for (auto it = root.begin(); it != root.end(); ++it) {
            addRecord(it.key(), it.value());
        }
    } else if (root.is_array()) {
        for (const auto& item : root) {
            if (!item.is_object())
                continue;
            auto version = firstString(item, {"version"});
            if (!version) {
                spdlog::debug("Skipping manifest array element without a version");
                continue;
            }
            addRecord(*version, item);
        }
    } else {
        return Error{ErrorCode::ManifestInvalid, "Manifest root must be an object or array"};
    }

    return manifest;
}

Result<ManifestEntry> BuildManifest::find(const EngineVersion& version) const {
    EngineVersion current = version;
    std::set<EngineVersion> seen;
    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        auto it = records_.find(current);
        if (it == records_.end()) {
            if (current == version) {
                return Error{ErrorCode::NotFound, "Engine version " + version +
                                                      " not present in manifest"};
            }
            return Error{ErrorCode::ManifestInvalid,
                         "Engine version " + version + " redirects to missing " + current};
        }
        const auto& rec = it->second;
        if (rec.redirect) {
            seen.insert(current);
            if (seen.count(*rec.redirect) != 0) {
                return Error{ErrorCode::ManifestInvalid,
                             "Redirect loop in manifest at " + *rec.redirect};
            }
            spdlog::debug("Manifest redirects {} -> {}", current, *rec.redirect);
            current = *rec.redirect;
            continue;
        }
        if (rec.problem) {
            return *rec.problem;
        }
        ManifestEntry entry = *rec.entry;
        entry.version = version;
        return entry;
    }
    return Error{ErrorCode::ManifestInvalid,
                 "Too many manifest redirects while resolving " + version};
}

std::vector<EngineVersion> BuildManifest::versions() const {
    std::vector<EngineVersion> out;
    out.reserve(records_.size());
    for (const auto& [version, rec] : records_) {
        out.push_back(version);
    }
    return out;
}

// ---------- ManifestResolver ----------

ManifestResolver::ManifestResolver(ManifestConfig config,
                                   std::shared_ptr<downloader::IHttpAdapter> http,
                                   std::shared_ptr<IClock> clock)
    : config_(std::move(config)), http_(std::move(http)), clock_(std::move(clock)) {
    if (config_.platform.empty()) {
        config_.platform = hostPlatform();
    }
    if (!clock_) {
        clock_ = makeSystemClock();
    }
}

Result<std::shared_ptr<const BuildManifest>>
ManifestResolver::manifest(const std::stop_token& cancel) {
    std::lock_guard<std::mutex> lk(mutex_);
    const auto now = clock_->now();
    const bool fresh = cached_ && now >= fetchedAt_ && now - fetchedAt_ < config_.ttl;
    if (fresh) {
        return cached_;
    }
    if (!http_) {
        return Error{ErrorCode::InvalidState, "No HTTP adapter configured"};
    }

    spdlog::debug("Fetching engine build manifest from {}", config_.url);
    auto body = downloader::fetchText(*http_, config_.url, config_.http, asShouldCancel(cancel));
    if (!body) {
        auto err = body.error();
        if (err.code == ErrorCode::NotFound || err.code == ErrorCode::PolicyViolation ||
            err.code == ErrorCode::IOError) {
            // The manifest itself being unreachable is a transport problem, not a missing version
            err = Error{ErrorCode::NetworkError, "Failed to fetch manifest: " + err.message};
        }
        spdlog::warn("Manifest fetch from {} failed: {}", config_.url, err.message);
        return err;
    }

    auto parsed = BuildManifest::parse(body.value(), config_.platform);
    if (!parsed) {
        spdlog::error("Manifest from {} is invalid: {}", config_.url, parsed.error().message);
        return parsed.error();
    }

    cached_ = std::make_shared<const BuildManifest>(std::move(parsed).value());
    fetchedAt_ = now;
    spdlog::info("Loaded engine manifest ({} versions, platform {})", cached_->size(),
                 config_.platform);
    return cached_;
}

Result<ManifestEntry> ManifestResolver::resolve(const EngineVersion& version,
                                                const std::stop_token& cancel) {
    auto doc = manifest(cancel);
    if (!doc) {
        return doc.error();
    }
    auto entry = doc.value()->find(version);
    if (entry && entry.value().insecure) {
        spdlog::warn("Engine version {} is marked insecure in the manifest", version);
    }
    return entry;
}

void ManifestResolver::invalidate() {
    std::lock_guard<std::mutex> lk(mutex_);
    cached_.reset();
}

} // namespace enginecache::manifest

#pragma once

#include <enginecache/core/cancellation.h>
#include <enginecache/core/clock.h>
#include <enginecache/core/types.h>
#include <enginecache/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace enginecache::manifest {

/**
 * Download descriptor for one engine version.
 */
struct ManifestEntry {
    EngineVersion version;
    std::string downloadUrl;
    std::string expectedSignature;
    std::optional<std::uint64_t> sizeBytes;
    bool insecure{false};
};

/**
 * Parsed build manifest.
 *
 * Accepted layouts (unknown fields are ignored):
 *   { "<ver>": { "downloadUrl"|"url": "...", "signature"|"sig": "..." } }
 *   { "<ver>": { "insecure": false, "redirect": null,
 *                "platforms": { "<platform>": { "url": "...", "sig": "..." } } } }
 *   { "schema": 1, "versions": <either of the above> }
 *   [ { "version": "<ver>", "downloadUrl": "...", "signature": "..." } ]
 */
class BuildManifest {
public:
    static constexpr int kMaxRedirects = 8;

    /// Parse a manifest document, selecting per-platform entries for `platform`.
    static Result<BuildManifest> parse(std::string_view document, std::string_view platform);

    /// Look up a version, following redirects. NotFound or ManifestInvalid on failure.
    [[nodiscard]] Result<ManifestEntry> find(const EngineVersion& version) const;

    [[nodiscard]] std::vector<EngineVersion> versions() const;
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

private:
    struct Record {
        std::optional<ManifestEntry> entry;
        std::optional<EngineVersion> redirect;
        std::optional<Error> problem; // entry present but unusable on this platform
    };

    std::map<EngineVersion, Record> records_;
};

struct ManifestConfig {
    std::string url{"https://central.spacestation14.io/builds/robust/manifest.json"};
    std::chrono::seconds ttl{300};
    std::string platform; // empty = host platform
    downloader::HttpRequestOptions http{};
};

/// Platform key of the running host as used by the build server ("linux-x64", "win-x64", ...).
std::string hostPlatform();

class IManifestResolver {
public:
    virtual ~IManifestResolver() = default;

    virtual Result<ManifestEntry> resolve(const EngineVersion& version,
                                          const std::stop_token& cancel) = 0;
    virtual void invalidate() = 0;
};

/**
 * Resolves versions against the remote manifest, reusing a fetched copy for `ttl`.
 *
 * Concurrent resolves share a single manifest fetch. When a refresh fails the previous
 * document is kept until it expires; the fetch error is then returned as-is.
 */
class ManifestResolver final : public IManifestResolver {
public:
    ManifestResolver(ManifestConfig config, std::shared_ptr<downloader::IHttpAdapter> http,
                     std::shared_ptr<IClock> clock);

    Result<ManifestEntry> resolve(const EngineVersion& version,
                                  const std::stop_token& cancel) override;
    void invalidate() override;

    /// Fetch (or reuse) the manifest document.
    Result<std::shared_ptr<const BuildManifest>> manifest(const std::stop_token& cancel);

    [[nodiscard]] const ManifestConfig& config() const noexcept { return config_; }

private:
    ManifestConfig config_;
    std::shared_ptr<downloader::IHttpAdapter> http_;
    std::shared_ptr<IClock> clock_;

    std::mutex mutex_;
    std::shared_ptr<const BuildManifest> cached_;
    TimePoint fetchedAt_{};
};

} // namespace enginecache::manifest

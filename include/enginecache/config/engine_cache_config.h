#pragma once

#include <enginecache/config/config_helpers.h>
#include <enginecache/engine/engine_manager.h>
#include <enginecache/manifest/manifest_resolver.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace enginecache::config {

// Longer retention limits are clamped; 100 years keeps the limit in seconds representable
inline constexpr std::uint64_t kMaxAgeDaysLimit = 36500;

/**
 * Settings resolved from environment, config file and defaults (in that order).
 */
struct EngineCacheConfig {
    std::filesystem::path configPath;
    bool configFileFound{false};

    // [store]
    std::filesystem::path storeRoot;

    // [manifest]
    std::string manifestUrl{"https://central.spacestation14.io/builds/robust/manifest.json"};
    std::chrono::seconds manifestTtl{300};
    std::string platform; // empty = host platform

    // [download]
    std::chrono::milliseconds timeout{std::chrono::minutes(10)};
    std::chrono::milliseconds progressInterval{100};
    std::uint64_t maxBytes{0};
    std::string packageName{"engine.zip"};
    std::string caPath;
    bool insecureTls{false};
    std::optional<std::string> proxy;
    std::string userAgent{"enginecache"};

    // [cull]
    std::optional<std::size_t> maxInstallations;
    std::optional<std::uint64_t> maxAgeDays;
    std::optional<std::chrono::seconds> cullInterval;
    bool cullOnStartup{false};

    // [logging]
    std::string logLevel{"info"};
    std::string logFile;

    // Keys that were present but unusable; defaults were kept
    std::vector<std::string> warnings;
};

/// Resolve configuration. A missing config file is not an error.
EngineCacheConfig loadConfig(const std::string& overridePath = "");

/// Build from already parsed "section.key" values; used by loadConfig.
EngineCacheConfig configFromValues(const ConfigValues& values);

manifest::ManifestConfig toManifestConfig(const EngineCacheConfig& cfg);
engine::EngineManagerConfig toManagerConfig(const EngineCacheConfig& cfg);

} // namespace enginecache::config

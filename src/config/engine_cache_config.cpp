#include <enginecache/config/engine_cache_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <system_error>

namespace enginecache::config {

namespace {

const std::string* lookup(const ConfigValues& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty())
        return nullptr;
    return &it->second;
}

template <typename Apply>
void readUint(const ConfigValues& values, const std::string& key, EngineCacheConfig& cfg,
              Apply&& apply) {
    if (const auto* raw = lookup(values, key)) {
        if (auto v = parse_uint(*raw)) {
            apply(*v);
        } else {
            cfg.warnings.push_back("Invalid value for " + key + ": '" + *raw +
                                   "' (using default)");
        }
    }
}

void readBool(const ConfigValues& values, const std::string& key, EngineCacheConfig& cfg,
              bool& target) {
    if (const auto* raw = lookup(values, key)) {
        if (auto v = parse_bool(*raw)) {
            target = *v;
        } else {
            cfg.warnings.push_back("Invalid value for " + key + ": '" + *raw +
                                   "' (using default)");
        }
    }
}

void readString(const ConfigValues& values, const std::string& key, std::string& target) {
    if (const auto* raw = lookup(values, key))
        target = *raw;
}

} // namespace

EngineCacheConfig configFromValues(const ConfigValues& values) {
    EngineCacheConfig cfg;

    if (const auto* root = lookup(values, "store.root"))
        cfg.storeRoot = expand_tilde(*root);

    readString(values, "manifest.url", cfg.manifestUrl);
    readString(values, "manifest.platform", cfg.platform);
    readUint(values, "manifest.ttl_seconds", cfg,
             [&](std::uint64_t v) { cfg.manifestTtl = std::chrono::seconds(v); });

    readUint(values, "download.timeout_ms", cfg, [&](std::uint64_t v) {
        if (v > 0)
            cfg.timeout = std::chrono::milliseconds(v);
    });
    readUint(values, "download.progress_interval_ms", cfg,
             [&](std::uint64_t v) { cfg.progressInterval = std::chrono::milliseconds(v); });
    readUint(values, "download.max_bytes", cfg, [&](std::uint64_t v) { cfg.maxBytes = v; });
    readString(values, "download.package_name", cfg.packageName);
    if (const auto* ca = lookup(values, "download.ca_path"))
        cfg.caPath = expand_tilde(*ca).string();
    readBool(values, "download.insecure_tls", cfg, cfg.insecureTls);
    if (const auto* proxy = lookup(values, "download.proxy"))
        cfg.proxy = *proxy;
    readString(values, "download.user_agent", cfg.userAgent);

    readUint(values, "cull.max_installations", cfg,
             [&](std::uint64_t v) { cfg.maxInstallations = static_cast<std::size_t>(v); });
    readUint(values, "cull.max_age_days", cfg, [&](std::uint64_t v) {
        if (v > kMaxAgeDaysLimit) {
            cfg.warnings.push_back("cull.max_age_days " + std::to_string(v) + " clamped to " +
                                   std::to_string(kMaxAgeDaysLimit));
            v = kMaxAgeDaysLimit;
        }
        cfg.maxAgeDays = v;
    });
    readUint(values, "cull.interval_seconds", cfg, [&](std::uint64_t v) {
        if (v > 0)
            cfg.cullInterval = std::chrono::seconds(v);
    });
    readBool(values, "cull.on_startup", cfg, cfg.cullOnStartup);

    readString(values, "logging.level", cfg.logLevel);
    if (const auto* file = lookup(values, "logging.file"))
        cfg.logFile = expand_tilde(*file).string();

    return cfg;
}

EngineCacheConfig loadConfig(const std::string& overridePath) {
    const auto path = get_config_path(overridePath);
    std::error_code ec;
    const bool found = std::filesystem::exists(path, ec);

    auto cfg = configFromValues(found ? parse_config_file(path) : ConfigValues{});
    cfg.configPath = path;
    cfg.configFileFound = found;

    if (const char* env = std::getenv("ENGINECACHE_ROOT"); env && *env) {
        cfg.storeRoot = expand_tilde(env);
    }
    if (cfg.storeRoot.empty()) {
        cfg.storeRoot = get_data_dir() / "engines";
    }

    for (const auto& w : cfg.warnings) {
        spdlog::warn("[Config] {}", w);
    }
    spdlog::debug("[Config] config={} (found: {}), root={}", path.string(), found,
                  cfg.storeRoot.string());
    return cfg;
}

manifest::ManifestConfig toManifestConfig(const EngineCacheConfig& cfg) {
    manifest::ManifestConfig mc;
    mc.url = cfg.manifestUrl;
    mc.ttl = cfg.manifestTtl;
    mc.platform = cfg.platform;
    mc.http.timeout = std::min(cfg.timeout, std::chrono::milliseconds(std::chrono::minutes(1)));
    mc.http.tls.insecure = cfg.insecureTls;
    mc.http.tls.caPath = cfg.caPath;
    mc.http.proxy = cfg.proxy;
    mc.http.userAgent = cfg.userAgent;
    return mc;
}

engine::EngineManagerConfig toManagerConfig(const EngineCacheConfig& cfg) {
    engine::EngineManagerConfig mc;
    mc.store.root = cfg.storeRoot;
    mc.store.packageFileName = cfg.packageName;

    mc.download.http.timeout = cfg.timeout;
    mc.download.http.tls.insecure = cfg.insecureTls;
    mc.download.http.tls.caPath = cfg.caPath;
    mc.download.http.proxy = cfg.proxy;
    mc.download.http.userAgent = cfg.userAgent;
    mc.download.progressInterval = cfg.progressInterval;
    mc.download.maxBytes = cfg.maxBytes;

    mc.cullPolicy.maxInstallations = cfg.maxInstallations;
    if (cfg.maxAgeDays) {
        const auto days = static_cast<std::int64_t>(std::min(*cfg.maxAgeDays, kMaxAgeDaysLimit));
        mc.cullPolicy.maxAge = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::hours(days * 24));
    }
    mc.cullInterval = cfg.cullInterval;
    mc.cullOnStartup = cfg.cullOnStartup;
    return mc;
}

} // namespace enginecache::config

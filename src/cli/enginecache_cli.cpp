#include <enginecache/cli/enginecache_cli.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <set>
#include <string>

namespace enginecache::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) {
    g_interrupted.store(true);
}

std::string formatTime(TimePoint tp) {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

std::string formatBytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 3) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.1f %s", v, units[u]);
    return buf;
}

int reportError(const Error& err) {
    std::cerr << "Error: " << err.message << "\n";
    return exitCodeFor(err);
}

} // namespace

int exitCodeFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::Success: return kExitOk;
        case ErrorCode::NotFound: return kExitNotFound;
        case ErrorCode::OperationCancelled: return kExitCancelled;
        default: return kExitError;
    }
}

std::optional<int> parseLogLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

EngineCacheCLI::EngineCacheCLI(boost::asio::any_io_executor executor)
    : executor_(std::move(executor)) {
    app_ = std::make_unique<CLI::App>("Engine installation cache manager", "enginecache");
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_,
                     "Config file (default: ~/.config/enginecache/config.toml)");
    app_->add_option("--root", rootOverride_, "Engine store directory");
    app_->add_option("--manifest-url", manifestUrl_, "Build manifest URL");
    app_->add_option("--log-level", logLevel_, "trace|debug|info|warn|error|off");
    app_->add_option("--bundled", bundledDir_,
                     "Serve pre-bundled engines from this directory (no downloads)");

    registerCommands();
}

EngineCacheCLI::~EngineCacheCLI() = default;

void EngineCacheCLI::registerCommands() {
    auto* path = app_->add_subcommand("path", "Print the install directory of a version");
    path->add_option("version", version_, "Engine version")->required();
    path->callback([this] { pending_ = &EngineCacheCLI::cmdPath; });

    auto* sig = app_->add_subcommand("signature", "Print the recorded signature of a version");
    sig->add_option("version", version_, "Engine version")->required();
    sig->callback([this] { pending_ = &EngineCacheCLI::cmdSignature; });

    auto* dl = app_->add_subcommand("download", "Install a version if it is not cached yet");
    dl->add_option("version", version_, "Engine version")->required();
    dl->callback([this] { pending_ = &EngineCacheCLI::cmdDownload; });

    auto* ls = app_->add_subcommand("list", "List installed versions");
    ls->add_flag("--json", json_, "Output in JSON format");
    ls->callback([this] { pending_ = &EngineCacheCLI::cmdList; });

    auto* cull = app_->add_subcommand("cull", "Apply the retention policy");
    cull->add_flag("--dry-run", dryRun_, "Only report what would be removed");
    maxInstallationsOpt_ = cull->add_option("--max-installations", maxInstallations_,
                                            "Keep at most N unpinned installations");
    maxAgeDaysOpt_ =
        cull->add_option("--max-age-days", maxAgeDays_, "Remove versions unused for D days");
    cull->add_option("--pin", pins_, "Version to keep (repeatable)");
    cull->callback([this] { pending_ = &EngineCacheCLI::cmdCull; });

    auto* clear = app_->add_subcommand("clear", "Remove every idle installation");
    clear->add_flag("-y,--yes", yes_, "Do not ask for confirmation");
    clear->callback([this] { pending_ = &EngineCacheCLI::cmdClear; });

    auto* resolve = app_->add_subcommand("resolve", "Look up a version in the build manifest");
    resolve->add_option("version", version_, "Engine version")->required();
    resolve->callback([this] { pending_ = &EngineCacheCLI::cmdResolve; });
}

void EngineCacheCLI::configureLogging() {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config_.logFile.empty()) {
        try {
            sinks.push_back(
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(config_.logFile, false));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << config_.logFile << ": " << e.what() << "\n";
        }
    }
    auto logger = std::make_shared<spdlog::logger>("enginecache", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_default_logger(logger);

    // Precedence: --log-level > ENGINECACHE_LOG_LEVEL > config > warn
    std::string level = logLevel_;
    if (level.empty()) {
        if (const char* env = std::getenv("ENGINECACHE_LOG_LEVEL"); env && *env)
            level = env;
    }
    if (level.empty())
        level = config_.logLevel.empty() ? "warn" : config_.logLevel;

    if (auto lvl = parseLogLevel(level)) {
        spdlog::set_level(static_cast<spdlog::level::level_enum>(*lvl));
    } else {
        spdlog::set_level(spdlog::level::warn);
        spdlog::warn("Unknown log level '{}', using warn", level);
    }
}

std::shared_ptr<downloader::IHttpAdapter> EngineCacheCLI::http() {
    if (!http_)
        http_ = downloader::makeCurlHttpAdapter();
    return http_;
}

Result<std::shared_ptr<engine::IEngineManager>> EngineCacheCLI::makeManager() {
    if (!bundledDir_.empty()) {
        return engine::makeBundledEngineManager(config::expand_tilde(bundledDir_),
                                                config_.packageName);
    }
    auto clock = makeSystemClock();
    engine::EngineManagerDeps deps;
    deps.http = http();
    deps.clock = clock;
    deps.executor = executor_;
    deps.resolver = std::make_shared<manifest::ManifestResolver>(config::toManifestConfig(config_),
                                                                 deps.http, clock);
    auto managerConfig = config::toManagerConfig(config_);
    // No background culling for one-shot commands
    managerConfig.cullInterval.reset();
    managerConfig.cullOnStartup = false;
    return engine::makeDynamicEngineManager(std::move(managerConfig), std::move(deps));
}

int EngineCacheCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    config_ = config::loadConfig(configPath_);
    if (!rootOverride_.empty())
        config_.storeRoot = config::expand_tilde(rootOverride_);
    if (!manifestUrl_.empty())
        config_.manifestUrl = manifestUrl_;
    configureLogging();

    if (!pending_) {
        std::cerr << app_->help();
        return kExitError;
    }
    try {
        return (this->*pending_)();
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return kExitError;
    }
}

int EngineCacheCLI::cmdPath() {
    auto mgr = makeManager();
    if (!mgr)
        return reportError(mgr.error());
    auto path = mgr.value()->getEnginePath(version_);
    if (!path)
        return reportError(path.error());
    std::cout << path.value().string() << "\n";
    return kExitOk;
}

int EngineCacheCLI::cmdSignature() {
    auto mgr = makeManager();
    if (!mgr)
        return reportError(mgr.error());
    auto sig = mgr.value()->getEngineSignature(version_);
    if (!sig)
        return reportError(sig.error());
    std::cout << sig.value() << "\n";
    return kExitOk;
}

int EngineCacheCLI::cmdDownload() {
    auto mgr = makeManager();
    if (!mgr)
        return reportError(mgr.error());
    auto& manager = mgr.value();

    std::stop_source cancel;
    g_interrupted.store(false);
    auto previous = std::signal(SIGINT, onInterrupt);

    auto progress = [](const downloader::ProgressEvent& ev) {
        if (ev.stage != downloader::ProgressStage::Downloading) {
            std::cerr << "[" << downloader::stageToString(ev.stage) << "]\n";
            return;
        }
        std::cerr << "\r" << formatBytes(ev.downloadedBytes);
        if (ev.totalBytes)
            std::cerr << " / " << formatBytes(*ev.totalBytes);
        if (ev.percentage) {
            char pct[16];
            std::snprintf(pct, sizeof(pct), " (%.0f%%)", *ev.percentage);
            std::cerr << pct;
        }
        std::cerr << std::flush;
    };

    auto future = manager->downloadEngineIfNecessary(version_, progress, cancel.get_token());
    while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_interrupted.load() && !cancel.stop_requested()) {
            std::cerr << "\nCancelling...\n";
            cancel.request_stop();
        }
    }
    std::signal(SIGINT, previous);

    auto result = future.get();
    if (!result)
        return reportError(result.error());
    if (!result.value()) {
        std::cerr << "Download cancelled\n";
        return kExitCancelled;
    }
    auto path = manager->getEnginePath(version_);
    if (!path)
        return reportError(path.error());
    std::cout << path.value().string() << "\n";
    return kExitOk;
}

int EngineCacheCLI::cmdList() {
    auto mgr = makeManager();
    if (!mgr)
        return reportError(mgr.error());
    auto installs = mgr.value()->list();

    if (json_) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& inst : installs) {
            arr.push_back({{"version", inst.version},
                           {"path", inst.installPath.string()},
                           {"signature", inst.signature},
                           {"size_bytes", inst.sizeBytes},
                           {"installed_at", toUnixSeconds(inst.installedAt)},
                           {"last_used_at", toUnixSeconds(inst.lastUsedAt)}});
        }
        std::cout << arr.dump(2) << "\n";
        return kExitOk;
    }

    if (installs.empty()) {
        std::cout << "No engines installed\n";
        return kExitOk;
    }
    for (const auto& inst : installs) {
        std::cout << inst.version << "  " << formatBytes(inst.sizeBytes) << "  last used "
                  << formatTime(inst.lastUsedAt) << "  " << inst.signature.substr(0, 12) << "\n";
    }
    return kExitOk;
}

int EngineCacheCLI::cmdCull() {
    if (maxInstallationsOpt_ && maxInstallationsOpt_->count() > 0)
        config_.maxInstallations = maxInstallations_;
    if (maxAgeDaysOpt_ && maxAgeDaysOpt_->count() > 0)
        config_.maxAgeDays = maxAgeDays_;

    std::set<EngineVersion> pinned(pins_.begin(), pins_.end());

    if (dryRun_ || !bundledDir_.empty()) {
        if (!bundledDir_.empty()) {
            std::cout << "Bundled engines are never culled\n";
            return kExitOk;
        }
        // Dry runs go straight to a culler so nothing is removed
        store::LocalStore store({config_.storeRoot, config_.packageName}, makeSystemClock());
        if (auto r = store.open(); !r)
            return reportError(r.error());
        store::Culler culler(store, makeSystemClock());
        store::CullOptions options;
        options.policy = config::toManagerConfig(config_).cullPolicy;
        options.dryRun = true;
        auto stats = culler.cullMaybe(pinned, options);
        if (!stats)
            return reportError(stats.error());
        for (const auto& v : stats.value().removedVersions)
            std::cout << "would remove " << v << "\n";
        std::cout << stats.value().removed << " of " << stats.value().scanned
                  << " installation(s) would be removed ("
                  << formatBytes(stats.value().bytesReclaimed) << ")\n";
        return kExitOk;
    }

    auto mgr = makeManager();
    if (!mgr)
        return reportError(mgr.error());
    auto stats = mgr.value()->doEngineCullMaybeAsync(pinned).get();
    if (!stats)
        return reportError(stats.error());
    for (const auto& v : stats.value().removedVersions)
        std::cout << "removed " << v << "\n";
    for (const auto& e : stats.value().errors)
        std::cerr << e << "\n";
    std::cout << stats.value().removed << " installation(s) removed, "
              << formatBytes(stats.value().bytesReclaimed) << " reclaimed\n";
    return stats.value().errors.empty() ? kExitOk : kExitError;
}

int EngineCacheCLI::cmdClear() {
    if (!yes_) {
        std::cerr << "Remove all engine installations under " << config_.storeRoot.string()
                  << "? [y/N] ";
        std::string answer;
        std::getline(std::cin, answer);
        if (answer != "y" && answer != "Y" && answer != "yes") {
            std::cerr << "Aborted\n";
            return kExitCancelled;
        }
    }
    auto mgr = makeManager();
    if (!mgr)
        return reportError(mgr.error());
    auto r = mgr.value()->clearAllEngines();
    if (!r)
        return reportError(r.error());
    return kExitOk;
}

int EngineCacheCLI::cmdResolve() {
    manifest::ManifestResolver resolver(config::toManifestConfig(config_), http(),
                                        makeSystemClock());
    auto entry = resolver.resolve(version_, std::stop_token{});
    if (!entry)
        return reportError(entry.error());
    const auto& e = entry.value();
    std::cout << "version:   " << e.version << "\n"
              << "platform:  " << resolver.config().platform << "\n"
              << "url:       " << e.downloadUrl << "\n"
              << "signature: " << e.expectedSignature << "\n";
    if (e.sizeBytes)
        std::cout << "size:      " << formatBytes(*e.sizeBytes) << "\n";
    if (e.insecure)
        std::cout << "insecure:  yes\n";
    return kExitOk;
}

} // namespace enginecache::cli

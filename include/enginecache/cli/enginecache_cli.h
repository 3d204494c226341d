#pragma once

#include <enginecache/config/engine_cache_config.h>
#include <enginecache/engine/engine_manager.h>

#include <boost/asio/any_io_executor.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CLI {
class App;
class Option;
} // namespace CLI

namespace enginecache::cli {

// Process exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitNotFound = 2;
inline constexpr int kExitCancelled = 130;

int exitCodeFor(const Error& error);

/// Parse a log level name ("debug", "warn", ...). Case-insensitive.
std::optional<int> parseLogLevel(const std::string& s);

class EngineCacheCLI {
public:
    explicit EngineCacheCLI(boost::asio::any_io_executor executor);
    ~EngineCacheCLI();

    EngineCacheCLI(const EngineCacheCLI&) = delete;
    EngineCacheCLI& operator=(const EngineCacheCLI&) = delete;

    int run(int argc, char* argv[]);

private:
    void registerCommands();
    void configureLogging();
    Result<std::shared_ptr<engine::IEngineManager>> makeManager();
    std::shared_ptr<downloader::IHttpAdapter> http();

    int cmdPath();
    int cmdSignature();
    int cmdDownload();
    int cmdList();
    int cmdCull();
    int cmdClear();
    int cmdResolve();

    boost::asio::any_io_executor executor_;
    std::unique_ptr<CLI::App> app_;
    config::EngineCacheConfig config_;
    std::shared_ptr<downloader::IHttpAdapter> http_;

    // Global options
    std::string configPath_;
    std::string rootOverride_;
    std::string manifestUrl_;
    std::string logLevel_;
    std::string bundledDir_;

    // Subcommand arguments
    std::string version_;
    std::vector<std::string> pins_;
    bool dryRun_{false};
    bool yes_{false};
    bool json_{false};
    std::size_t maxInstallations_{0};
    std::uint64_t maxAgeDays_{0};
    CLI::Option* maxInstallationsOpt_{nullptr};
    CLI::Option* maxAgeDaysOpt_{nullptr};
    int (EngineCacheCLI::*pending_)() = nullptr;
};

} // namespace enginecache::cli

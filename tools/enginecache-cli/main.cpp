#include <enginecache/cli/enginecache_cli.h>

#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; EngineCacheCLI::run() adjusts based on flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        boost::asio::thread_pool pool{4};

        int result = 0;
        {
            enginecache::cli::EngineCacheCLI cli(pool.get_executor());
            result = cli.run(argc, argv);
        }

        pool.join();
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

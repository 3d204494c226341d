// enginecache command line: exit codes, log levels and offline subcommands

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <enginecache/cli/enginecache_cli.h>
#include <enginecache/store/local_store.h>

#include "../../common/fake_services.h"
#include "../../common/test_helpers_catch2.h"

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace enginecache;
using namespace enginecache::cli;
using Catch::Matchers::ContainsSubstring;

namespace {

// Redirects std::cout for the lifetime of the object.
class CaptureStdout {
public:
    CaptureStdout() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CaptureStdout() { std::cout.rdbuf(previous_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

struct CliFixture {
    test::TempDir tmp{"enginecache_cli_"};
    test::ScopedEnvVar config{"ENGINECACHE_CONFIG", (tmp.path() / "none.toml").string()};
    test::ScopedEnvVar root{"ENGINECACHE_ROOT", std::nullopt};
    test::ScopedEnvVar level{"ENGINECACHE_LOG_LEVEL", "off"};
    boost::asio::thread_pool pool{2};

    ~CliFixture() {
        pool.join();
        spdlog::set_level(spdlog::level::warn);
    }

    int run(std::vector<std::string> args, std::string* out = nullptr) {
        args.insert(args.begin(), "enginecache");
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(a.data());
        EngineCacheCLI cli(pool.get_executor());
        CaptureStdout capture;
        int rc = cli.run(static_cast<int>(argv.size()), argv.data());
        if (out)
            *out = capture.str();
        return rc;
    }

    fs::path storeRoot() const { return tmp.path() / "engines"; }

    void installDirect(const std::string& version, const std::string& contents) {
        store::LocalStoreConfig cfg;
        cfg.root = storeRoot();
        store::LocalStore s(cfg, std::make_shared<test::FakeClock>());
        REQUIRE(s.open());
        auto staging = s.stagingPath(version);
        REQUIRE(staging);
        test::write_file(staging.value() / "engine.zip", contents);
        REQUIRE(s.commit(version, staging.value(), test::sha256Of(contents)));
    }
};

} // namespace

TEST_CASE("Errors map to process exit codes", "[cli]") {
    CHECK(exitCodeFor(Error{ErrorCode::NotFound, "x"}) == kExitNotFound);
    CHECK(exitCodeFor(Error{ErrorCode::OperationCancelled, "x"}) == kExitCancelled);
    CHECK(exitCodeFor(Error{ErrorCode::HashMismatch, "x"}) == kExitError);
    CHECK(exitCodeFor(Error{ErrorCode::NetworkError, "x"}) == kExitError);
}

TEST_CASE("Log level names", "[cli]") {
    CHECK(parseLogLevel("debug") == static_cast<int>(spdlog::level::debug));
    CHECK(parseLogLevel("WARNING") == static_cast<int>(spdlog::level::warn));
    CHECK(parseLogLevel("err") == static_cast<int>(spdlog::level::err));
    CHECK(parseLogLevel("silent") == static_cast<int>(spdlog::level::off));
    CHECK_FALSE(parseLogLevel("loud").has_value());
}

TEST_CASE_METHOD(CliFixture, "path and signature read the local store", "[cli][store]") {
    installDirect("1.0.0", "engine");

    std::string out;
    CHECK(run({"--root", storeRoot().string(), "path", "1.0.0"}, &out) == kExitOk);
    CHECK(out == (storeRoot() / "1.0.0").string() + "\n");

    CHECK(run({"--root", storeRoot().string(), "signature", "1.0.0"}, &out) == kExitOk);
    CHECK(out == test::sha256Of("engine") + "\n");

    CHECK(run({"--root", storeRoot().string(), "path", "2.0.0"}) == kExitNotFound);
}

TEST_CASE_METHOD(CliFixture, "list prints installations as JSON", "[cli][store]") {
    installDirect("1.0.0", "one");
    installDirect("2.0.0", "two");

    std::string out;
    REQUIRE(run({"--root", storeRoot().string(), "list", "--json"}, &out) == kExitOk);
    auto j = nlohmann::json::parse(out);
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    CHECK(j[0]["version"] == "1.0.0");
    CHECK(j[1]["signature"] == test::sha256Of("two"));
}

TEST_CASE_METHOD(CliFixture, "cull --dry-run leaves the store untouched", "[cli][cull]") {
    installDirect("1.0.0", "one");
    installDirect("2.0.0", "two");

    std::string out;
    REQUIRE(run({"--root", storeRoot().string(), "cull", "--dry-run", "--max-installations",
                 "0", "--pin", "2.0.0"},
                &out) == kExitOk);
    CHECK_THAT(out, ContainsSubstring("would remove 1.0.0"));
    CHECK(fs::exists(storeRoot() / "1.0.0"));
    CHECK(fs::exists(storeRoot() / "2.0.0"));
}

TEST_CASE_METHOD(CliFixture, "cull and clear remove idle installations", "[cli][cull]") {
    installDirect("1.0.0", "one");
    installDirect("2.0.0", "two");

    REQUIRE(run({"--root", storeRoot().string(), "cull", "--max-installations", "0", "--pin",
                 "2.0.0"}) == kExitOk);
    CHECK_FALSE(fs::exists(storeRoot() / "1.0.0"));
    CHECK(fs::exists(storeRoot() / "2.0.0"));

    REQUIRE(run({"--root", storeRoot().string(), "clear", "--yes"}) == kExitOk);
    CHECK_FALSE(fs::exists(storeRoot() / "2.0.0"));
}

TEST_CASE_METHOD(CliFixture, "Bundled engines are served without downloads", "[cli][bundled]") {
    const auto bundle = tmp.path() / "bundle";
    test::write_file(bundle / "3.1.0" / "engine.zip", "shipped");

    std::string out;
    CHECK(run({"--bundled", bundle.string(), "download", "3.1.0"}, &out) == kExitOk);
    CHECK(out == (bundle / "3.1.0").string() + "\n");
    CHECK(run({"--bundled", bundle.string(), "download", "9.9.9"}) == kExitNotFound);
}

TEST_CASE_METHOD(CliFixture, "A subcommand is required", "[cli]") {
    CHECK(run({}) != kExitOk);
}

#include <catch2/catch_test_macros.hpp>

#include <enginecache/engine/engine_manager.h>

#include "../../common/fake_services.h"
#include "../../common/test_helpers_catch2.h"

#include <chrono>
#include <filesystem>
#include <future>

namespace fs = std::filesystem;
using namespace enginecache;
using namespace enginecache::engine;

TEST_CASE("Bundled manager serves shipped packages", "[engine][bundled]") {
    test::TempDir tmp;
    const auto bundle = tmp.path() / "bundle";
    test::write_file(bundle / "1.0.0" / "engine.zip", "bundled-one");
    test::write_file(bundle / "2.0.0" / "engine.zip", "bundled-two");
    test::write_file(bundle / "incomplete" / "readme.txt", "no package");
    test::write_file(bundle / "loose.zip", "not a directory");

    auto made = makeBundledEngineManager(bundle);
    REQUIRE(made);
    auto manager = made.value();

    auto list = manager->list();
    REQUIRE(list.size() == 2);
    CHECK(list[0].version == "1.0.0");
    CHECK(list[1].version == "2.0.0");

    auto path = manager->getEnginePath("1.0.0");
    REQUIRE(path);
    CHECK(path.value() == bundle / "1.0.0");

    auto sig = manager->getEngineSignature("2.0.0");
    REQUIRE(sig);
    CHECK(sig.value() == test::sha256Of("bundled-two"));

    CHECK(manager->state("1.0.0") == EngineState::Installed);
    CHECK(manager->state("incomplete") == EngineState::Absent);

    auto have = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE(have.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    CHECK(have.get().value());

    auto missing = manager->downloadEngineIfNecessary("3.0.0");
    auto r = missing.get();
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::NotFound);
    CHECK(manager->getEnginePath("3.0.0").error().code == ErrorCode::NotFound);
}

TEST_CASE("Bundled manager never deletes shipped packages", "[engine][bundled]") {
    test::TempDir tmp;
    const auto bundle = tmp.path() / "bundle";
    test::write_file(bundle / "1.0.0" / "engine.zip", "bundled");

    auto made = makeBundledEngineManager(bundle);
    REQUIRE(made);
    auto manager = made.value();

    REQUIRE(manager->clearAllEngines());
    auto cull = manager->doEngineCullMaybeAsync();
    auto stats = cull.get();
    REQUIRE(stats);
    CHECK(stats.value().scanned == 1);
    CHECK(stats.value().removed == 0);
    CHECK(fs::exists(bundle / "1.0.0" / "engine.zip"));
}

TEST_CASE("Bundled manager prefers a shipped sidecar", "[engine][bundled]") {
    test::TempDir tmp;
    const auto bundle = tmp.path() / "bundle";
    test::write_file(bundle / "1.0.0" / "game.zip", "payload");
    test::write_file(bundle / "1.0.0" / ".enginecache.json",
                     R"({"format":1,"version":"1.0.0","signature":"feedface",)"
                     R"("installed_at":0,"last_used_at":0,"size_bytes":7,"package":"game.zip"})");

    auto made = makeBundledEngineManager(bundle, "game.zip");
    REQUIRE(made);
    auto sig = made.value()->getEngineSignature("1.0.0");
    REQUIRE(sig);
    CHECK(sig.value() == "feedface");
}

TEST_CASE("Bundled manager requires its directory", "[engine][bundled]") {
    test::TempDir tmp;
    auto made = makeBundledEngineManager(tmp.path() / "nope");
    REQUIRE_FALSE(made);
    CHECK(made.error().code == ErrorCode::NotFound);
}

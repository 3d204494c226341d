// Download-on-demand engine manager

#include <catch2/catch_test_macros.hpp>

#include <enginecache/engine/engine_manager.h>

#include "../../common/fake_services.h"
#include "../../common/test_helpers_catch2.h"

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace enginecache;
using namespace enginecache::engine;
using namespace std::chrono_literals;

namespace {

constexpr const char* kManifestUrl = "https://builds.example/manifest.json";

template <typename T> T await(std::future<T>& f) {
    REQUIRE(f.wait_for(10s) == std::future_status::ready);
    return f.get();
}

bool eventually(const std::function<bool()>& pred) {
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

bool emptyOrMissing(const fs::path& p) {
    std::error_code ec;
    return !fs::exists(p, ec) || fs::is_empty(p, ec);
}

struct ManagerFixture {
    test::TempDir tmp{"enginecache_mgr_"};
    std::shared_ptr<test::FakeHttpAdapter> http = std::make_shared<test::FakeHttpAdapter>();
    std::shared_ptr<test::FakeClock> clock = std::make_shared<test::FakeClock>();
    nlohmann::json manifest = nlohmann::json::object();
    boost::asio::thread_pool pool{4};

    ~ManagerFixture() {
        http->release();
        pool.join();
    }

    fs::path root() const { return tmp.path() / "engines"; }

    static std::string packageUrl(const std::string& version) {
        return "https://builds.example/" + version + "/linux-x64.zip";
    }

    // Serve `body` for the version and list it in the manifest with the given signature.
    void publish(const std::string& version, const std::string& body,
                 std::optional<std::string> signature = std::nullopt) {
        http->setBody(packageUrl(version), body);
        manifest[version] = {{"url", packageUrl(version)},
                             {"sig", signature.value_or(test::sha256Of(body))}};
        http->setBody(kManifestUrl, manifest.dump());
    }

    std::shared_ptr<IEngineManager>
    makeManager(std::function<void(EngineManagerConfig&)> tweak = {}) {
        EngineManagerConfig cfg;
        cfg.store.root = root();
        cfg.download.progressInterval = 0ms;
        if (tweak)
            tweak(cfg);

        manifest::ManifestConfig mc;
        mc.url = kManifestUrl;
        mc.platform = "linux-x64";
        mc.ttl = 0s;

        EngineManagerDeps deps;
        deps.resolver = std::make_shared<manifest::ManifestResolver>(mc, http, clock);
        deps.downloader = downloader::makePackageDownloader(http, cfg.download);
        deps.http = http;
        deps.clock = clock;
        deps.executor = pool.get_executor();

        auto made = makeDynamicEngineManager(std::move(cfg), std::move(deps));
        REQUIRE(made);
        return made.value();
    }

    static bool waitForState(IEngineManager& m, const EngineVersion& v, EngineState want) {
        return eventually([&] { return m.state(v) == want; });
    }
};

std::vector<EngineEvent> drain(EngineEventQueue& q) {
    std::vector<EngineEvent> out;
    while (auto ev = q.try_pop())
        out.push_back(std::move(*ev));
    return out;
}

} // namespace

TEST_CASE_METHOD(ManagerFixture, "Download installs a missing version", "[engine][download]") {
    publish("1.0.0", "engine-1.0.0");
    auto manager = makeManager();
    CHECK(manager->state("1.0.0") == EngineState::Absent);
    CHECK(manager->getEnginePath("1.0.0").error().code == ErrorCode::NotFound);

    std::vector<downloader::ProgressEvent> progress;
    std::mutex progressMutex;
    auto fut = manager->downloadEngineIfNecessary("1.0.0", [&](const auto& ev) {
        std::lock_guard<std::mutex> lk(progressMutex);
        progress.push_back(ev);
    });
    auto r = await(fut);
    REQUIRE(r.has_value());
    CHECK(r.value());

    CHECK(manager->state("1.0.0") == EngineState::Installed);
    auto path = manager->getEnginePath("1.0.0");
    REQUIRE(path);
    CHECK(path.value() == root() / "1.0.0");
    CHECK(test::read_file(path.value() / "engine.zip") == "engine-1.0.0");

    auto sig = manager->getEngineSignature("1.0.0");
    REQUIRE(sig);
    CHECK(sig.value() == test::sha256Of("engine-1.0.0"));

    std::lock_guard<std::mutex> lk(progressMutex);
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.front().stage == downloader::ProgressStage::Resolving);
    const bool sawVerifying =
        std::any_of(progress.begin(), progress.end(), [](const downloader::ProgressEvent& ev) {
            return ev.stage == downloader::ProgressStage::Verifying;
        });
    CHECK(sawVerifying);
}

TEST_CASE_METHOD(ManagerFixture, "Download of an installed version is a no-op",
                 "[engine][download]") {
    publish("1.0.0", "engine");
    auto manager = makeManager();
    auto first = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE(await(first).value());

    auto second = manager->downloadEngineIfNecessary("1.0.0");
    CHECK(second.wait_for(0s) == std::future_status::ready);
    CHECK(await(second).value());
    CHECK(http->calls(packageUrl("1.0.0")) == 1);
}

TEST_CASE_METHOD(ManagerFixture, "Concurrent requests share one transfer", "[engine][dedup]") {
    publish("1.0.0", "shared-engine");
    auto manager = makeManager();
    http->hold(packageUrl("1.0.0"));

    auto a = manager->downloadEngineIfNecessary("1.0.0");
    auto b = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE(http->waitForParked(1));
    CHECK(manager->state("1.0.0") == EngineState::Downloading);
    auto c = manager->downloadEngineIfNecessary("1.0.0");
    http->release();

    CHECK(await(a).value());
    CHECK(await(b).value());
    CHECK(await(c).value());
    CHECK(http->calls(packageUrl("1.0.0")) == 1);
    CHECK(manager->list().size() == 1);
}

TEST_CASE_METHOD(ManagerFixture, "A failed shared transfer fails every waiter alike",
                 "[engine][dedup]") {
    publish("1.0.0", "tampered", test::sha256Of("original"));
    auto manager = makeManager([](EngineManagerConfig& c) { c.corruptRetries = 0; });
    http->hold(packageUrl("1.0.0"));

    auto a = manager->downloadEngineIfNecessary("1.0.0");
    auto b = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE(http->waitForParked(1));
    auto c = manager->downloadEngineIfNecessary("1.0.0");
    http->release();

    auto ra = await(a);
    auto rb = await(b);
    auto rc = await(c);
    REQUIRE_FALSE(ra.has_value());
    REQUIRE_FALSE(rb.has_value());
    REQUIRE_FALSE(rc.has_value());
    CHECK(ra.error().code == ErrorCode::HashMismatch);
    CHECK(rb.error().code == ra.error().code);
    CHECK(rc.error().code == ra.error().code);
    CHECK(rb.error().message == ra.error().message);
    CHECK(rc.error().message == ra.error().message);

    CHECK(http->calls(packageUrl("1.0.0")) == 1);
    CHECK(manager->state("1.0.0") == EngineState::Failed);
    CHECK(emptyOrMissing(root() / ".staging"));
}

TEST_CASE_METHOD(ManagerFixture, "Different versions download independently", "[engine][dedup]") {
    publish("1.0.0", "one");
    publish("2.0.0", "two");
    auto manager = makeManager();

    auto a = manager->downloadEngineIfNecessary("1.0.0");
    auto b = manager->downloadEngineIfNecessary("2.0.0");
    CHECK(await(a).value());
    CHECK(await(b).value());
    CHECK(manager->list().size() == 2);
}

TEST_CASE_METHOD(ManagerFixture, "Signature mismatch leaves nothing installed",
                 "[engine][integrity]") {
    publish("1.0.0", "tampered", test::sha256Of("original"));
    auto manager = makeManager([](EngineManagerConfig& c) { c.corruptRetries = 0; });
    auto events = manager->events();

    auto fut = manager->downloadEngineIfNecessary("1.0.0");
    auto r = await(fut);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::HashMismatch);

    CHECK(manager->state("1.0.0") == EngineState::Failed);
    CHECK_FALSE(fs::exists(root() / "1.0.0"));
    CHECK(emptyOrMissing(root() / ".staging"));
    CHECK(manager->list().empty());
    CHECK(http->calls(packageUrl("1.0.0")) == 1);

    auto seen = drain(*events);
    auto failed = std::find_if(seen.begin(), seen.end(), [](const EngineEvent& ev) {
        return ev.kind == EngineEventKind::Failed;
    });
    REQUIRE(failed != seen.end());
    REQUIRE(failed->error.has_value());
    CHECK(failed->error->code == ErrorCode::HashMismatch);
}

TEST_CASE_METHOD(ManagerFixture, "A corrupt download is retried once", "[engine][integrity]") {
    publish("1.0.0", "good-package");
    http->setSequence(packageUrl("1.0.0"), {test::FakeHttpAdapter::Response{"corrupt", {}},
                                           test::FakeHttpAdapter::Response{"good-package", {}}});
    auto manager = makeManager();

    auto fut = manager->downloadEngineIfNecessary("1.0.0");
    auto r = await(fut);
    REQUIRE(r.has_value());
    CHECK(r.value());
    CHECK(http->calls(packageUrl("1.0.0")) == 2);
    CHECK(test::read_file(root() / "1.0.0" / "engine.zip") == "good-package");
}

TEST_CASE_METHOD(ManagerFixture, "Repeated corruption fails after the retry",
                 "[engine][integrity]") {
    publish("1.0.0", "always-corrupt", test::sha256Of("expected"));
    auto manager = makeManager();

    auto fut = manager->downloadEngineIfNecessary("1.0.0");
    auto r = await(fut);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::HashMismatch);
    CHECK(http->calls(packageUrl("1.0.0")) == 2);
    CHECK_FALSE(fs::exists(root() / "1.0.0"));
}

TEST_CASE_METHOD(ManagerFixture, "Failures are reported with their cause", "[engine][errors]") {
    auto manager = makeManager();

    SECTION("version missing from the manifest") {
        publish("1.0.0", "x");
        auto fut = manager->downloadEngineIfNecessary("9.9.9");
        auto r = await(fut);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::NotFound);
        CHECK(manager->state("9.9.9") == EngineState::Failed);
    }

    SECTION("manifest unreachable") {
        http->setError(kManifestUrl, Error{ErrorCode::NetworkError, "offline"});
        auto fut = manager->downloadEngineIfNecessary("1.0.0");
        auto r = await(fut);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::NetworkError);
    }

    SECTION("package server error") {
        publish("1.0.0", "x");
        http->setError(packageUrl("1.0.0"), Error{ErrorCode::ServerError, "HTTP 500"});
        auto fut = manager->downloadEngineIfNecessary("1.0.0");
        auto r = await(fut);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::ServerError);
        CHECK(emptyOrMissing(root() / ".staging"));
    }

    SECTION("unsafe version name") {
        auto fut = manager->downloadEngineIfNecessary("../outside");
        CHECK(fut.wait_for(0s) == std::future_status::ready);
        auto r = fut.get();
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE_METHOD(ManagerFixture, "A failed version can be retried", "[engine][errors]") {
    auto manager = makeManager();
    http->setBody(kManifestUrl, "{}");
    auto first = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE_FALSE(await(first).has_value());
    CHECK(manager->state("1.0.0") == EngineState::Failed);

    publish("1.0.0", "now-available");
    auto second = manager->downloadEngineIfNecessary("1.0.0");
    CHECK(await(second).value());
    CHECK(manager->state("1.0.0") == EngineState::Installed);
}

TEST_CASE_METHOD(ManagerFixture, "Cancelling the only waiter aborts the install",
                 "[engine][cancel]") {
    publish("1.0.0", "engine");
    auto manager = makeManager();
    http->hold(packageUrl("1.0.0"));

    std::stop_source source;
    auto fut = manager->downloadEngineIfNecessary("1.0.0", {}, source.get_token());
    REQUIRE(http->waitForParked(1));
    source.request_stop();

    auto r = await(fut);
    REQUIRE(r.has_value());
    CHECK_FALSE(r.value());

    REQUIRE(waitForState(*manager, "1.0.0", EngineState::Absent));
    CHECK_FALSE(fs::exists(root() / "1.0.0"));
    CHECK(emptyOrMissing(root() / ".staging"));

    // A later request starts over
    http->release();
    auto again = manager->downloadEngineIfNecessary("1.0.0");
    CHECK(await(again).value());
    CHECK(http->calls(packageUrl("1.0.0")) == 2);
}

TEST_CASE_METHOD(ManagerFixture, "A request after every waiter left starts a fresh install",
                 "[engine][cancel]") {
    publish("1.0.0", "engine");
    auto manager = makeManager();
    http->hold(packageUrl("1.0.0"));

    std::stop_source source;
    auto abandoned = manager->downloadEngineIfNecessary("1.0.0", {}, source.get_token());
    REQUIRE(http->waitForParked(1));
    source.request_stop();
    auto fresh = manager->downloadEngineIfNecessary("1.0.0");

    auto r = await(abandoned);
    REQUIRE(r.has_value());
    CHECK_FALSE(r.value());

    // The fresh job waits for the abandoned one to unwind, then transfers on its own
    REQUIRE(eventually([&] {
        return http->calls(packageUrl("1.0.0")) == 2 && http->parked() == 1;
    }));
    http->release();
    auto installed = await(fresh);
    REQUIRE(installed.has_value());
    CHECK(installed.value());
    CHECK(manager->state("1.0.0") == EngineState::Installed);
}

TEST_CASE_METHOD(ManagerFixture, "Cancelling one waiter keeps the shared install",
                 "[engine][cancel]") {
    publish("1.0.0", "engine");
    auto manager = makeManager();
    http->hold(packageUrl("1.0.0"));

    std::stop_source source;
    auto cancelled = manager->downloadEngineIfNecessary("1.0.0", {}, source.get_token());
    auto kept = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE(http->waitForParked(1));
    source.request_stop();

    auto r = await(cancelled);
    REQUIRE(r.has_value());
    CHECK_FALSE(r.value());

    http->release();
    CHECK(await(kept).value());
    CHECK(manager->state("1.0.0") == EngineState::Installed);
    CHECK(http->calls(packageUrl("1.0.0")) == 1);
}

TEST_CASE_METHOD(ManagerFixture, "An already cancelled token returns false", "[engine][cancel]") {
    publish("1.0.0", "engine");
    auto manager = makeManager();
    std::stop_source source;
    source.request_stop();
    auto fut = manager->downloadEngineIfNecessary("1.0.0", {}, source.get_token());
    auto r = await(fut);
    REQUIRE(r.has_value());
    CHECK_FALSE(r.value());
    CHECK(http->calls(kManifestUrl) == 0);
}

TEST_CASE_METHOD(ManagerFixture, "Installations survive a restart", "[engine][store]") {
    publish("1.0.0", "persisted");
    {
        auto manager = makeManager();
        auto fut = manager->downloadEngineIfNecessary("1.0.0");
        REQUIRE(await(fut).value());
    }
    auto manager = makeManager();
    CHECK(manager->state("1.0.0") == EngineState::Installed);
    auto fut = manager->downloadEngineIfNecessary("1.0.0");
    CHECK(await(fut).value());
    CHECK(http->calls(packageUrl("1.0.0")) == 1);
}

TEST_CASE_METHOD(ManagerFixture, "Events report installs and progress", "[engine][events]") {
    publish("1.0.0", std::string(20000, 'x'));
    auto manager = makeManager();
    auto events = manager->events();

    auto fut = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE(await(fut).value());

    auto seen = drain(*events);
    REQUIRE_FALSE(seen.empty());
    CHECK(seen.back().kind == EngineEventKind::Installed);
    CHECK(seen.back().version == "1.0.0");
    const auto progress = std::count_if(seen.begin(), seen.end(), [](const EngineEvent& ev) {
        return ev.kind == EngineEventKind::Progress;
    });
    CHECK(progress > 0);
}

TEST_CASE_METHOD(ManagerFixture, "clearAllEngines keeps pinned versions", "[engine][clear]") {
    publish("1.0.0", "one");
    publish("2.0.0", "two");
    auto manager = makeManager();
    auto a = manager->downloadEngineIfNecessary("1.0.0");
    auto b = manager->downloadEngineIfNecessary("2.0.0");
    REQUIRE(await(a).value());
    REQUIRE(await(b).value());

    auto events = manager->events();
    auto pin = manager->pin("1.0.0");
    REQUIRE(pin);
    REQUIRE(manager->clearAllEngines());
    CHECK(manager->state("1.0.0") == EngineState::Installed);
    CHECK(manager->state("2.0.0") == EngineState::Absent);
    CHECK_FALSE(fs::exists(root() / "2.0.0"));

    auto seen = drain(*events);
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].kind == EngineEventKind::Evicted);
    CHECK(seen[0].version == "2.0.0");

    pin.release();
    REQUIRE(manager->clearAllEngines());
    CHECK(manager->list().empty());
}

TEST_CASE_METHOD(ManagerFixture, "Culling honours pins and recency", "[engine][cull]") {
    publish("1.0.0", "one");
    publish("2.0.0", "two");
    publish("3.0.0", "three");
    auto manager =
        makeManager([](EngineManagerConfig& c) { c.cullPolicy.maxInstallations = 1; });
    for (const char* v : {"1.0.0", "2.0.0", "3.0.0"}) {
        auto fut = manager->downloadEngineIfNecessary(v);
        REQUIRE(await(fut).value());
        clock->advance(1h);
    }

    auto pin = manager->pin("1.0.0");
    auto fut = manager->doEngineCullMaybeAsync();
    auto stats = await(fut);
    REQUIRE(stats);
    CHECK(stats.value().removedVersions == std::vector<EngineVersion>{"2.0.0"});
    CHECK(manager->state("1.0.0") == EngineState::Installed);
    CHECK(manager->state("3.0.0") == EngineState::Installed);

    // Extra pins protect versions without a live pin
    auto fut2 = manager->doEngineCullMaybeAsync({"3.0.0"});
    auto stats2 = await(fut2);
    REQUIRE(stats2);
    CHECK(stats2.value().removed == 0);
}

TEST_CASE_METHOD(ManagerFixture, "A pin taken during a cull keeps its version",
                 "[engine][cull][pin]") {
    publish("1.0.0", "one");
    publish("2.0.0", "two");
    auto manager =
        makeManager([](EngineManagerConfig& c) { c.cullPolicy.maxInstallations = 0; });
    for (const char* v : {"1.0.0", "2.0.0"}) {
        auto fut = manager->downloadEngineIfNecessary(v);
        REQUIRE(await(fut).value());
    }

    // Pinned after the cull snapshotted pins and installations
    std::optional<EnginePin> late;
    clock->onNextNow([&] { late.emplace(manager->pin("1.0.0")); });
    auto fut = manager->doEngineCullMaybeAsync();
    auto stats = await(fut);
    REQUIRE(stats);
    CHECK(stats.value().removedVersions == std::vector<EngineVersion>{"2.0.0"});
    CHECK(stats.value().skipped == 1);
    REQUIRE(late.has_value());
    CHECK(manager->state("1.0.0") == EngineState::Installed);
    CHECK(fs::exists(root() / "1.0.0" / "engine.zip"));
}

TEST_CASE_METHOD(ManagerFixture, "Version state resets across install and removal",
                 "[engine][state]") {
    auto manager = makeManager();
    http->setBody(kManifestUrl, "{}");
    auto failed = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE_FALSE(await(failed).has_value());
    CHECK(manager->state("1.0.0") == EngineState::Failed);

    publish("1.0.0", "engine");
    auto first = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE(await(first).value());
    CHECK(manager->state("1.0.0") == EngineState::Installed);

    REQUIRE(manager->clearAllEngines());
    CHECK(manager->state("1.0.0") == EngineState::Absent);

    // The version lock dropped with the removal is recreated for the next install
    auto second = manager->downloadEngineIfNecessary("1.0.0");
    REQUIRE(await(second).value());
    CHECK(manager->state("1.0.0") == EngineState::Installed);
    CHECK(http->calls(packageUrl("1.0.0")) == 2);
    REQUIRE(manager->clearAllEngines());
    CHECK(manager->list().empty());
}

TEST_CASE_METHOD(ManagerFixture, "Culling on startup applies the policy", "[engine][cull]") {
    publish("1.0.0", "one");
    publish("2.0.0", "two");
    {
        auto manager = makeManager();
        for (const char* v : {"1.0.0", "2.0.0"}) {
            auto fut = manager->downloadEngineIfNecessary(v);
            REQUIRE(await(fut).value());
            clock->advance(1h);
        }
    }

    auto manager = makeManager([](EngineManagerConfig& c) {
        c.cullPolicy.maxInstallations = 1;
        c.cullOnStartup = true;
    });
    REQUIRE(waitForState(*manager, "1.0.0", EngineState::Absent));
    CHECK(manager->state("2.0.0") == EngineState::Installed);
}

TEST_CASE("Pins are reference counted", "[engine][pin]") {
    auto registry = std::make_shared<PinRegistry>();
    {
        EnginePin a(registry, "1.0.0");
        EnginePin b(registry, "1.0.0");
        CHECK(registry->isPinned("1.0.0"));
        a.release();
        CHECK(registry->isPinned("1.0.0"));

        EnginePin moved(std::move(b));
        CHECK(moved);
        CHECK(moved.version() == "1.0.0");
        CHECK(registry->snapshot() == std::set<EngineVersion>{"1.0.0"});
    }
    CHECK_FALSE(registry->isPinned("1.0.0"));
    CHECK(registry->snapshot().empty());
}

TEST_CASE("Manager construction validates its dependencies", "[engine]") {
    test::TempDir tmp;
    EngineManagerConfig cfg;
    cfg.store.root = tmp.path() / "engines";
    EngineManagerDeps deps;
    deps.downloader = downloader::makePackageDownloader(std::make_shared<test::FakeHttpAdapter>(),
                                                        cfg.download);
    auto made = makeDynamicEngineManager(cfg, std::move(deps));
    REQUIRE_FALSE(made);
    CHECK(made.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Event queues drop when full", "[engine][events]") {
    EngineEventBus bus;
    auto q = bus.subscribe(2);
    for (int i = 0; i < 5; ++i) {
        EngineEvent ev;
        ev.version = std::to_string(i);
        bus.publish(ev);
    }
    CHECK(q->capacity() == 2);
    CHECK(q->dropped() == 3);
    CHECK(bus.published() == 5);
    auto first = q->try_pop();
    REQUIRE(first);
    CHECK(first->version == "0");

    q.reset();
    bus.publish(EngineEvent{});
    CHECK(bus.published() == 6);
}

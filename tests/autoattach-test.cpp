#include <doctest/doctest.h>

#include "fakeinvoker.hpp"

#include <usbshare/autoattach.hpp>
#include <usbshare/error.hpp>

#include <boost/asio/thread_pool.hpp>

#include <thread>
#include <vector>

using namespace usbshare;

namespace {

struct TrackerFixture {
    explicit TrackerFixture (bool refreshed = true)
        : store{tool, versionCache, ListFormat::AUTO, context}
        , commands{tool, versionCache, store}
        , tracker{tool, commands, store}
    {
        tool.respond("--version", 0, "4.3.0");
        tool.respond("state", 0, testing::kState);
        if (refreshed) {
            store.refresh().get();
        }
    }

    ~TrackerFixture () {
        tool.release();
        context.join();
    }

    testing::FakeInvoker tool;
    VersionCache versionCache{tool};
    boost::asio::thread_pool context{1};
    DeviceStore store;
    Commands commands;
    AutoAttachTracker tracker;
};

} // <anonymous>

TEST_CASE_FIXTURE(TrackerFixture, "an unshared device cannot be auto-attached") {
    CHECK_THROWS_AS(tracker.start("1-1"), DeviceNotBound);
    CHECK_THROWS_AS(tracker.start("7-7"), DeviceNotFound);
    CHECK(tool.spawned().empty());
    CHECK(tracker.sessions().empty());
    CHECK_FALSE(tracker.active("1-1"));
}

TEST_CASE_FIXTURE(TrackerFixture, "start attaches once and then keeps watching") {
    tracker.start("1-4");

    CHECK(tool.count("attach") == 1);
    REQUIRE(tool.spawned().size() == 1);
    CHECK(tool.spawned().front()
        == (Arguments{"attach", "--wsl", "--busid", "1-4", "--auto-attach"}));
    CHECK(tracker.active("1-4"));

    auto sessions = tracker.sessions();
    REQUIRE(sessions.size() == 1);
    CHECK(sessions[0].locator == "1-4");
    CHECK(sessions[0].active);
    CHECK(sessions[0].description == "USB Serial Device (COM3)");
    CHECK(sessions[0].hardwareId == "2341:0043");
}

TEST_CASE_FIXTURE(TrackerFixture, "an attached device is not attached again") {
    tracker.start("2-3");
    CHECK(tool.count("attach") == 0);
    CHECK(tool.spawned().size() == 1);
}

TEST_CASE_FIXTURE(TrackerFixture, "starting an active session is a no-op") {
    tracker.start("1-4");
    tracker.start("1-4");
    CHECK(tool.spawned().size() == 1);
    CHECK(tool.running() == 1);
    CHECK(tracker.sessions().size() == 1);
}

TEST_CASE_FIXTURE(TrackerFixture, "concurrent starts for one device spawn one watcher") {
    std::vector<std::thread> threads;
    for (auto i = 0; i < 4; ++i) {
        threads.emplace_back([this] { tracker.start("2-3"); });
    }
    for (auto& t : threads) {
        t.join();
    }
    CHECK(tool.spawned().size() == 1);
}

TEST_CASE_FIXTURE(TrackerFixture, "stop terminates the watcher") {
    tracker.start("1-4");
    tracker.stop("1-4");
    CHECK(tool.running() == 0);
    CHECK_FALSE(tracker.active("1-4"));
    auto sessions = tracker.sessions();
    REQUIRE(sessions.size() == 1);
    CHECK_FALSE(sessions[0].active);

    // Stopping twice, or something never started, is harmless.
    tracker.stop("1-4");
    tracker.stop("9-9");

    tracker.start("1-4");
    CHECK(tool.spawned().size() == 2);
    CHECK(tracker.active("1-4"));
}

TEST_CASE_FIXTURE(TrackerFixture, "a watcher that exits makes the session inactive") {
    tracker.start("2-3");
    tool.exitSpawned(0);
    CHECK_FALSE(tracker.active("2-3"));

    tracker.start("2-3");
    CHECK(tool.spawned().size() == 2);
}

TEST_CASE_FIXTURE(TrackerFixture, "a session may be keyed by the persisted guid") {
    tracker.start("4b8a2c5e-91f0-4c3a-8d1e-0f6a7b9c2d31");
    REQUIRE(tool.spawned().size() == 1);
    CHECK(tool.spawned().front()
        == (Arguments{"attach", "--wsl", "--busid", "1-4", "--auto-attach"}));
    CHECK(tracker.active("4b8a2c5e-91f0-4c3a-8d1e-0f6a7b9c2d31"));
}

TEST_CASE_FIXTURE(TrackerFixture, "bus id and guid name the same session") {
    tracker.start("2-3");
    tracker.start("dc0f8ae0-5ba9-4ba9-8e4a-e3b8b0c8e4b6");
    CHECK(tool.spawned().size() == 1);
    CHECK(tool.running() == 1);
    CHECK(tracker.sessions().size() == 1);
    CHECK(tracker.active("dc0f8ae0-5ba9-4ba9-8e4a-e3b8b0c8e4b6"));

    tracker.stop("dc0f8ae0-5ba9-4ba9-8e4a-e3b8b0c8e4b6");
    CHECK(tool.running() == 0);
    CHECK_FALSE(tracker.active("2-3"));
}

TEST_CASE_FIXTURE(TrackerFixture, "a session can be stopped by bus id after its device is unplugged") {
    tracker.start("2-3");
    tool.respond("state", 0, R"({"Devices": [
        {"BusId": null, "Description": "USB Mass Storage Device",
         "PersistedGuid": "dc0f8ae0-5ba9-4ba9-8e4a-e3b8b0c8e4b6"}
    ]})");
    store.refresh().get();

    CHECK(tracker.active("2-3"));
    tracker.stop("2-3");
    CHECK(tool.running() == 0);
    CHECK(tracker.sessions().size() == 1);
}

TEST_CASE("start fetches the device list when there is none yet") {
    TrackerFixture f{false};
    f.tracker.start("2-3");
    CHECK(f.tool.count("state") == 1);
    CHECK(f.tracker.active("2-3"));
}

TEST_CASE_FIXTURE(TrackerFixture, "destroying the tracker stops every watcher") {
    {
        AutoAttachTracker local{tool, commands, store};
        local.start("1-4");
        local.start("2-3");
        CHECK(tool.running() == 2);
    }
    CHECK(tool.running() == 0);
}

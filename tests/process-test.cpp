#include <doctest/doctest.h>

#include <usbshare/error.hpp>
#include <usbshare/process.hpp>

#include <boost/predef.h>

#if BOOST_OS_LINUX

#include "platform.hpp"

#include <chrono>
#include <string>
#include <thread>

using namespace usbshare;

TEST_CASE("run captures exit code, stdout and stderr") {
    SystemProcessInvoker sh{"sh"};
    auto result = sh.run({"-c", "echo out; echo err >&2; exit 3"}, Elevation::NONE);
    CHECK(result.exitCode == 3);
    CHECK(result.out == "out\n");
    CHECK(result.err == "err\n");

    auto ok = sh.run({"-c", "printf '%s' \"$0\"", "1-4"}, Elevation::NONE);
    CHECK(ok.exitCode == 0);
    CHECK(ok.out == "1-4");
}

TEST_CASE("a tool that cannot be found is ToolNotFound") {
    SystemProcessInvoker missing{"usbshare-no-such-tool"};
    CHECK_THROWS_AS(missing.run({"--version"}, Elevation::NONE), ToolNotFound);
    CHECK_THROWS_AS(missing.spawn({"attach"}), ToolNotFound);

    SystemProcessInvoker missingPath{"/nonexistent/usbipd"};
    CHECK_THROWS_AS(missingPath.run({"state"}, Elevation::NONE), ToolNotFound);
}

TEST_CASE("spawned processes run until terminated") {
    SystemProcessInvoker sleeper{"sleep"};
    auto process = sleeper.spawn({"30"});
    CHECK(process->running());
    process->terminate();
    CHECK_FALSE(process->running());
}

TEST_CASE("a spawned process that exits is no longer running") {
    SystemProcessInvoker sh{"sh"};
    auto process = sh.spawn({"-c", "exit 0"});
    for (auto i = 0; i < 100 && process->running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    CHECK_FALSE(process->running());
}

TEST_CASE("the UAC script quotes its arguments for PowerShell") {
    auto script = uacScript(R"(C:\Program Files\usbipd-win\usbipd.exe)", {"bind", "--busid", "1-4"});
    CHECK(script.find(R"(-FilePath 'C:\Program Files\usbipd-win\usbipd.exe')") != std::string::npos);
    CHECK(script.find("-ArgumentList 'bind --busid 1-4'") != std::string::npos);
    CHECK(script.find("-Verb RunAs") != std::string::npos);
    CHECK(script.find("exit 1223") != std::string::npos);

    auto quoted = uacScript(R"(C:\Users\O'Neil\usbipd.exe)", {"unbind", "--all"});
    CHECK(quoted.find(R"('C:\Users\O''Neil\usbipd.exe')") != std::string::npos);
}

#endif

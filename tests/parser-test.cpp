#include <doctest/doctest.h>

#include "fakeinvoker.hpp"

#include <usbshare/error.hpp>
#include <usbshare/parser.hpp>

#include <algorithm>
#include <string>

using namespace usbshare;

TEST_CASE("version is the first major.minor.patch group") {
    CHECK(parseVersion("1.4.2") == (Version{1, 4, 2}));
    CHECK(parseVersion("usbipd-win 4.3.0+42.Branch.master.Sha.1a2b3c\r\n") == (Version{4, 3, 0}));
    CHECK(parseVersion("build 12 of 2.10.7, then 3.0.0") == (Version{2, 10, 7}));
    CHECK((Version{3, 9, 9} < Version{4, 0, 0}));
}

TEST_CASE("version without three numeric groups is a parse error") {
    CHECK_THROWS_AS(parseVersion(""), ParseError);
    CHECK_THROWS_AS(parseVersion("usbipd-win 4.3"), ParseError);
    CHECK_THROWS_AS(parseVersion("unknown"), ParseError);
}

TEST_CASE("state json yields one device per row") {
    auto result = parseState(testing::kState);
    REQUIRE(result.devices.size() == 4);
    CHECK(result.warnings.empty());

    const auto& mouse = result.devices[0];
    CHECK(mouse.busId() == "1-1");
    CHECK(mouse.hardwareId() == "046d:c52b");
    CHECK(mouse.serial().empty());
    CHECK_FALSE(mouse.bound());
    CHECK(mouse.state() == "Not shared");

    const auto& arduino = result.devices[1];
    CHECK(arduino.locator() == "1-4");
    CHECK(arduino.serial() == "75833353934351F0E1C1");
    CHECK(arduino.bound());
    CHECK_FALSE(arduino.attached());
    CHECK(arduino.persistedGuid() == "4b8a2c5e-91f0-4c3a-8d1e-0f6a7b9c2d31");

    const auto& disk = result.devices[2];
    CHECK(disk.attached());
    CHECK(disk.forced());
    CHECK(disk.clientAddress() == "172.29.112.1");
    CHECK(disk.state() == "Attached (forced)");

    const auto& uart = result.devices[3];
    CHECK_FALSE(uart.connected());
    CHECK(uart.locator() == "0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9");
    CHECK(uart.persisted());
    CHECK(uart.state() == "Persisted");
}

TEST_CASE("state rows that cannot be identified are dropped with a warning") {
    auto json = R"({"Devices": [
        {"BusId": "1-1", "Description": "A", "InstanceId": "USB\\VID_0001&PID_0002\\X"},
        {"BusId": null, "PersistedGuid": null, "Description": "Ghost"},
        {"BusId": "1-2", "Description": "B", "InstanceId": "USB\\VID_0003&PID_0004\\Y"}
    ]})";
    auto result = parseState(json);
    CHECK(result.devices.size() == 2);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].find("Ghost") != std::string::npos);
}

TEST_CASE("every parsed attached device is also bound") {
    auto json = R"({"Devices": [
        {"BusId": "3-1", "ClientIPAddress": "10.0.0.2", "PersistedGuid": null},
        {"BusId": "3-2", "ClientIPAddress": "10.0.0.3",
         "PersistedGuid": "11111111-2222-3333-4444-555555555555"}
    ]})";
    auto result = parseState(json);
    REQUIRE(result.devices.size() == 1);
    CHECK(result.devices[0].busId() == "3-2");
    CHECK(result.warnings.size() == 1);

    auto all = parseState(testing::kState);
    CHECK(std::all_of(all.devices.begin(), all.devices.end(), [] (const UsbDevice& d) {
        return !d.attached() || d.bound();
    }));
}

TEST_CASE("malformed state json is a parse error") {
    CHECK_THROWS_AS(parseState("{\"Devices\": ["), ParseError);
    CHECK_THROWS_AS(parseState("{\"Something\": 1}"), ParseError);
    CHECK_THROWS_AS(parseState("{\"Devices\": null}"), ParseError);
    CHECK_THROWS_AS(parseState("{\"Devices\": \"x\"}"), ParseError);
    CHECK_THROWS_AS(parseState("{\"Devices\": {\"BusId\": \"1-1\"}}"), ParseError);
    CHECK(parseState("{\"Devices\": []}").devices.empty());
    try {
        parseState("not json");
        FAIL("expected a ParseError");
    }
    catch (const ParseError& e) {
        CHECK(e.offending() == "not json");
    }
}

TEST_CASE("list table with connected and persisted sections") {
    auto table =
        "Connected:\n"
        "BUSID  VID:PID    DEVICE                                                        STATE\n"
        "1-1    046d:c52b  USB Input Device, Logitech USB Receiver                       Not shared\n"
        "1-4    2341:0043  USB Serial Device (COM3)                                      Shared\n"
        "2-3    0781:5581  USB Mass Storage Device                                       Attached (forced)\n"
        "\n"
        "Persisted:\n"
        "GUID                                  DEVICE\n"
        "0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9  FT232R USB UART\n";
    auto result = parseList(table);
    CHECK(result.warnings.empty());
    REQUIRE(result.devices.size() == 4);

    CHECK(result.devices[0].description() == "USB Input Device, Logitech USB Receiver");
    CHECK(result.devices[0].state() == "Not shared");
    CHECK(result.devices[1].bound());
    CHECK(result.devices[1].hardwareId() == "2341:0043");
    CHECK(result.devices[2].attached());
    CHECK(result.devices[2].forced());
    CHECK(result.devices[3].locator() == "0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9");
    CHECK(result.devices[3].description() == "FT232R USB UART");
}

TEST_CASE("older list tables report the attached client") {
    auto table =
        "Connected:\r\n"
        "BUSID  VID:PID    DEVICE                    STATE\r\n"
        "1-4    2341:0043  Arduino Uno (COM3)        Not attached\r\n"
        "1-7    0781:5581  USB Mass Storage Device   Attached - Ubuntu-22.04\r\n";
    auto result = parseList(table);
    REQUIRE(result.devices.size() == 2);
    CHECK(result.devices[0].bound());
    CHECK_FALSE(result.devices[0].attached());
    CHECK(result.devices[1].attached());
    CHECK(result.devices[1].clientAddress() == "Ubuntu-22.04");
}

TEST_CASE("an unrecognized list row is dropped with a warning") {
    auto table =
        "Connected:\n"
        "BUSID  VID:PID    DEVICE             STATE\n"
        "1-1    046d:c52b  Receiver           Not shared\n"
        "garbage row that is not a device\n"
        "1-2    1234:abcd  Keyboard           Shared\n";
    auto result = parseList(table);
    CHECK(result.devices.size() == 2);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].find("garbage row") != std::string::npos);
}

TEST_CASE("list output without a Connected section is a parse error") {
    CHECK_THROWS_AS(parseList(""), ParseError);
    CHECK_THROWS_AS(parseList("usbipd: error: unknown command\n"), ParseError);
}

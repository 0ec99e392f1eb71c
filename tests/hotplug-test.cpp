#include <doctest/doctest.h>

#include <usbshare/hotplug.hpp>

#if BOOST_OS_LINUX

#include "platform.hpp"

using namespace usbshare;

TEST_CASE("udev does not report host devices under WSL") {
    CHECK(hotplugSeesHost() == !runningUnderWsl());
}

TEST_CASE("udevadm usb_device blocks become hotplug events") {
    auto block =
        "UDEV  [8412.523407] add      /devices/pci0000:00/0000:00:14.0/usb1/1-4 (usb)\n"
        "ACTION=add\n"
        "DEVPATH=/devices/pci0000:00/0000:00:14.0/usb1/1-4\n"
        "SUBSYSTEM=usb\n"
        "DEVNAME=/dev/bus/usb/001/007\n"
        "DEVTYPE=usb_device\n"
        "ID_VENDOR_ID=2341\n"
        "ID_MODEL_ID=0043\n"
        "ID_MODEL_ENC=Arduino\\x20Uno\\x20R3\n"
        "SEQNUM=5127\n"
        "\n";
    auto event = HotplugEvent{};
    REQUIRE(parseUdevadm(block, event));
    CHECK(event.type == HotplugEvent::ADD);
    CHECK(event.path == "/devices/pci0000:00/0000:00:14.0/usb1/1-4");
    CHECK(event.hardwareId == "2341:0043");
    CHECK(event.description == "Arduino Uno R3");
}

TEST_CASE("removal blocks carry no model information") {
    auto block =
        "UDEV  [8420.100233] remove   /devices/pci0000:00/0000:00:14.0/usb1/1-4 (usb)\n"
        "ACTION=remove\n"
        "DEVPATH=/devices/pci0000:00/0000:00:14.0/usb1/1-4\n"
        "SUBSYSTEM=usb\n"
        "DEVTYPE=usb_device\n"
        "\n";
    auto event = HotplugEvent{};
    REQUIRE(parseUdevadm(block, event));
    CHECK(event.type == HotplugEvent::REMOVE);
    CHECK(event.hardwareId.empty());
}

TEST_CASE("interfaces, other actions and the banner are ignored") {
    auto event = HotplugEvent{};
    CHECK_FALSE(parseUdevadm(
        "UDEV  [8412.530112] add      /devices/pci0000:00/0000:00:14.0/usb1/1-4/1-4:1.0 (usb)\n"
        "ACTION=add\n"
        "DEVPATH=/devices/pci0000:00/0000:00:14.0/usb1/1-4/1-4:1.0\n"
        "SUBSYSTEM=usb\n"
        "DEVTYPE=usb_interface\n"
        "\n", event));
    CHECK_FALSE(parseUdevadm(
        "UDEV  [8415.000001] bind     /devices/pci0000:00/0000:00:14.0/usb1/1-4 (usb)\n"
        "ACTION=bind\n"
        "DEVPATH=/devices/pci0000:00/0000:00:14.0/usb1/1-4\n"
        "DEVTYPE=usb_device\n"
        "\n", event));
    CHECK_FALSE(parseUdevadm(
        "monitor will print the received events for:\n"
        "UDEV - the event which udev sends out after rule processing\n"
        "\n", event));
    CHECK_FALSE(parseUdevadm("", event));
}

#endif

#ifndef USBSHARE_HOTPLUG_HPP
#define USBSHARE_HOTPLUG_HPP

#include <boost/predef.h>

#include <functional>
#include <iostream>
#include <memory>
#include <string>

namespace usbshare {

struct HotplugEvent {
    enum {
        ADD,
        REMOVE
    } type;
    std::string path;
    std::string hardwareId;
    std::string description;
};

inline std::ostream& operator<< (std::ostream& os, const HotplugEvent& event) {
    return os << (event.type == HotplugEvent::ADD ? "ADD " : "REMOVE ") << event.path
        << (event.hardwareId.empty() ? "" : " ") << event.hardwareId;
}

// Watches the machine we run on for USB device arrival and removal. Under WSL that is the guest,
// which only sees devices once they are attached to it. The callback runs on the monitor's own
// thread.
class HotplugMonitor {
public:
    using Callback = std::function<void(const HotplugEvent&)>;

    explicit HotplugMonitor (Callback callback);
    // Throws ToolNotFound (Linux, no udevadm) or WindowsError if notifications are unavailable.

    ~HotplugMonitor ();

    HotplugMonitor (const HotplugMonitor&) = delete;
    HotplugMonitor& operator= (const HotplugMonitor&) = delete;

    void close ();

private:
    struct Impl;
    std::unique_ptr<Impl> mImpl;
};

bool hotplugSeesHost ();
// False under WSL, where udev reports guest attach and detach but not host arrivals.

#if BOOST_OS_LINUX
bool parseUdevadm (const std::string& block, HotplugEvent& event);
// Parse one blank-line-terminated block of `udevadm monitor --property` output, returning false
// on parse failure or if the block does not describe a USB device being added or removed.
#endif

} // namespace usbshare

#endif

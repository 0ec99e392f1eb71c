#include <usbshare/devices.hpp>

#include <boost/regex.hpp>

#include <algorithm>

namespace usbshare {

std::string UsbDevice::state () const {
    auto s = std::string{};
    if (!connected()) {
        return "Persisted";
    }
    else if (mAttached) {
        s = "Attached";
    }
    else if (mBound) {
        s = "Shared";
    }
    else {
        return "Not shared";
    }
    return mForced ? s + " (forced)" : s;
}

std::ostream& operator<< (std::ostream& os, const UsbDevice& d) {
    os << d.locator();
    if (d.hardwareId().size()) {
        os << ' ' << d.hardwareId();
    }
    return os << " '" << d.description() << "' " << d.state();
}

const UsbDevice* findDevice (const DeviceList& devices, const std::string& locator) {
    auto it = std::find_if(devices.cbegin(), devices.cend(), [&] (const UsbDevice& d) {
        return d.locator() == locator
            || (d.busId().size() && d.busId() == locator)
            || (d.persistedGuid().size() && d.persistedGuid() == locator);
    });
    return it == devices.cend() ? nullptr : &*it;
}

bool isGuid (const std::string& s) {
    static const boost::regex guid{
        R"([[:xdigit:]]{8}-[[:xdigit:]]{4}-[[:xdigit:]]{4}-[[:xdigit:]]{4}-[[:xdigit:]]{12})"};
    return boost::regex_match(s, guid);
}

} // namespace usbshare

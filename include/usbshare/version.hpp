#ifndef USBSHARE_VERSION_HPP
#define USBSHARE_VERSION_HPP

#include <iostream>
#include <tuple>

namespace usbshare {

struct Version {
    unsigned major = 0;
    unsigned minor = 0;
    unsigned patch = 0;
};

inline bool operator== (const Version& a, const Version& b) {
    return std::tie(a.major, a.minor, a.patch) == std::tie(b.major, b.minor, b.patch);
}

inline bool operator!= (const Version& a, const Version& b) {
    return !(a == b);
}

inline bool operator< (const Version& a, const Version& b) {
    return std::tie(a.major, a.minor, a.patch) < std::tie(b.major, b.minor, b.patch);
}

inline std::ostream& operator<< (std::ostream& os, const Version& v) {
    return os << v.major << '.' << v.minor << '.' << v.patch;
}

} // namespace usbshare

#endif

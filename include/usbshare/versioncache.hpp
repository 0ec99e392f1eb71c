#ifndef USBSHARE_VERSIONCACHE_HPP
#define USBSHARE_VERSIONCACHE_HPP

#include <usbshare/log.hpp>
#include <usbshare/process.hpp>
#include <usbshare/version.hpp>

#include <mutex>

namespace usbshare {

// The tool cannot change version while we run, so `usbipd --version` is invoked at most once
// per successful computation. Concurrent first callers share the one invocation.
class VersionCache {
public:
    explicit VersionCache (ProcessInvoker& invoker) : mInvoker(invoker) {}

    VersionCache (const VersionCache&) = delete;
    VersionCache& operator= (const VersionCache&) = delete;

    const Version& get ();
    // Throws whatever the first computation threw; a later call tries again.

private:
    ProcessInvoker& mInvoker;
    std::mutex mMutex;
    bool mKnown = false;
    Version mVersion;
    log::Logger mLog;
};

} // namespace usbshare

#endif
